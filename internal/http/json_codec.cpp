#include "json_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cmath>
#include <stdexcept>

#include "internal/http/url.hpp"
#include "internal/util/errors.hpp"

namespace beatstore::http {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

Value StringValue(const std::string& text) {
  Value value;
  value.set_string_value(text);
  return value;
}

Value NumberValue(int64_t number) {
  Value value;
  value.set_number_value(static_cast<double>(number));
  return value;
}

Value NullValue() {
  Value value;
  value.set_null_value(google::protobuf::NULL_VALUE);
  return value;
}

Value OptionalString(const std::optional<std::string>& text) {
  return text ? StringValue(*text) : NullValue();
}

Value OptionalNumber(const std::optional<int64_t>& number) {
  return number ? NumberValue(*number) : NullValue();
}

std::optional<std::string> StringMember(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStringValue) {
    return std::nullopt;
  }
  return it->second.string_value();
}

std::optional<int64_t> IntegerMember(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return std::nullopt;
  }

  const auto& value = it->second;
  if (value.kind_case() == Value::kNumberValue) {
    const double number = value.number_value();
    if (std::trunc(number) != number || std::abs(number) > 9007199254740992.0) {
      throw util::InvalidArgument("Invalid beatId");
    }
    return static_cast<int64_t>(number);
  }

  if (value.kind_case() == Value::kStringValue) {
    const auto& text = value.string_value();
    if (text.empty()) {
      return std::nullopt;
    }
    int64_t parsed = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc() || end != text.data() + text.size()) {
      throw util::InvalidArgument("Invalid beatId");
    }
    return parsed;
  }

  throw util::InvalidArgument("Invalid beatId");
}

} // namespace

Value EncodeBeat(const service::BeatView& view) {
  const auto& beat = view.beat;

  Value value;
  auto& fields = *value.mutable_struct_value()->mutable_fields();
  fields["id"]          = NumberValue(beat.id);
  fields["title"]       = StringValue(beat.title);
  fields["slug"]        = StringValue(beat.slug);
  fields["description"] = OptionalString(beat.description);
  fields["genre"]       = OptionalString(beat.genre);
  fields["bpm"]         = OptionalNumber(beat.bpm);
  fields["duration"]    = OptionalNumber(beat.duration);
  fields["fileType"]    = StringValue(beat.file_type);
  fields["fileName"]    = StringValue(beat.file_name);
  fields["fileUrl"]     = StringValue(PercentEncodePath(view.file_url));
  return value;
}

std::string ToJson(const Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON: " + std::string(status.message()));
  }
  return json;
}

std::string BeatJson(const service::BeatView& view) {
  return ToJson(EncodeBeat(view));
}

std::string BeatListJson(const std::vector<service::BeatView>& views) {
  Value value;
  auto* list = value.mutable_list_value();
  for (const auto& view : views) {
    *list->add_values() = EncodeBeat(view);
  }
  return ToJson(value);
}

std::string InquiryReceiptJson(const service::InquiryReceipt& receipt) {
  Value value;
  auto& fields = *value.mutable_struct_value()->mutable_fields();
  fields["success"].set_bool_value(true);
  fields["inquiryId"] = NumberValue(receipt.inquiry_id);
  fields["message"]   = StringValue(receipt.message);
  return ToJson(value);
}

std::string ErrorJson(const std::string& message) {
  Value value;
  (*value.mutable_struct_value()->mutable_fields())["error"] = StringValue(message);
  return ToJson(value);
}

service::InquiryInput DecodeInquiry(const std::string& body) {
  Struct object;
  google::protobuf::util::JsonParseOptions options;
  auto status = google::protobuf::util::JsonStringToMessage(body, &object, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Invalid JSON");
  }

  service::InquiryInput input;
  input.beat_id = IntegerMember(object, "beatId");
  input.name    = StringMember(object, "name");
  input.email   = StringMember(object, "email");
  input.offer   = StringMember(object, "offer");
  return input;
}

} // namespace beatstore::http
