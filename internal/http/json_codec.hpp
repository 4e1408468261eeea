#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/service/catalog_service.hpp"

namespace beatstore::http {

/*
  JSON wire shapes of the HTTP API, built on google::protobuf::Value and
  printed with protobuf's JSON util.

  Beat: {id, title, slug, description, genre, bpm, duration, fileType,
         fileName, fileUrl}; absent optional fields are null and fileUrl is
         percent-encoded.
*/

google::protobuf::Value EncodeBeat(const service::BeatView& view);

std::string BeatJson(const service::BeatView& view);
std::string BeatListJson(const std::vector<service::BeatView>& views);
std::string InquiryReceiptJson(const service::InquiryReceipt& receipt);
std::string ErrorJson(const std::string& message);

std::string ToJson(const google::protobuf::Value& value);

/*
  Decodes {beatId, name, email, offer}. Absent or null members come back
  empty; validation is the service's job.

  Throws util::InvalidArgument("Invalid JSON") on malformed input or a
  non-object body, and for a beatId that is not an integer.
*/
service::InquiryInput DecodeInquiry(const std::string& body);

} // namespace beatstore::http
