#include "catalog_service.hpp"

#include <charconv>
#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/catalog/naming.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace beatstore::service {

using beatstore::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(prefix + ": " + result.message);
    case db::ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(prefix + ": " + result.message);
    default:
      throw std::runtime_error(prefix + ": " + result.Describe());
  }
}

BeatView ToBeatView(db::model::BeatRecord record) {
  BeatView view;
  view.file_url = std::string(kAudioRoutePrefix) + record.file_name;
  view.beat     = std::move(record);
  return view;
}

bool IsMissing(const std::optional<std::string>& field) {
  return !field.has_value() || field->empty();
}

// Client mistakes pass through untouched; everything else is logged as a fault.
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto log_latency = [&] {
    observability::Log(spdlog::level::debug, "call completed",
                       {StringField("route", route),
                        observability::IntField("latency_us", std::chrono::duration_cast<std::chrono::microseconds>(
                                                                  std::chrono::steady_clock::now() - started_at)
                                                                  .count())});
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      log_latency();
      return;
    } else {
      auto result = fn();
      log_latency();
      return result;
    }
  } catch (const util::InvalidArgument&) {
    throw;
  } catch (const util::NotFound&) {
    throw;
  } catch (const util::AlreadyExists&) {
    throw;
  } catch (const std::exception& ex) {
    BEATSTORE_LOG_ERROR("call failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository) {
    throw std::invalid_argument("catalog service requires a repository");
  }
}

std::vector<BeatView> CatalogService::ListBeats() {
  return ObserveCall("CatalogService.ListBeats", [&] {
    if (ctx_.sync_on_list && ctx_.synchronizer) {
      ctx_.synchronizer->Sync();
    }

    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListBeats(*tx);
    tx->Commit();

    std::vector<BeatView> views;
    views.reserve(records.size());
    for (auto& record : records) {
      views.push_back(ToBeatView(std::move(record)));
    }
    return views;
  });
}

BeatView CatalogService::GetBeat(std::string_view id_text) {
  return ObserveCall("CatalogService.GetBeat", [&] {
    int64_t id = 0;
    const auto* first = id_text.data();
    const auto* last  = id_text.data() + id_text.size();
    auto [end, ec]    = std::from_chars(first, last, id);
    if (id_text.empty() || ec != std::errc() || end != last || id <= 0) {
      throw util::InvalidArgument("Invalid beat id");
    }

    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetBeat(*tx, id);
    tx->Commit();

    if (!record) {
      throw util::NotFound("Beat not found");
    }
    return ToBeatView(std::move(*record));
  });
}

InquiryReceipt CatalogService::SubmitInquiry(const InquiryInput& input) {
  return ObserveCall("CatalogService.SubmitInquiry", [&] {
    if (!input.beat_id || IsMissing(input.name) || IsMissing(input.email) || IsMissing(input.offer)) {
      throw util::InvalidArgument("Missing required fields");
    }

    // syntactic only: an '@' and a '.' somewhere
    const auto& email = *input.email;
    if (email.find('@') == std::string::npos || email.find('.') == std::string::npos) {
      throw util::InvalidArgument("Invalid email format");
    }

    db::model::InquiryRecord record;
    record.beat_id = *input.beat_id;
    record.name    = *input.name;
    record.email   = email;
    record.offer   = *input.offer;

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->InsertInquiry(*tx, record), "insert inquiry");
    tx->Commit();

    BEATSTORE_LOG_INFO("Inquiry received", {observability::IntField("inquiry_id", record.id),
                                             observability::IntField("beat_id", record.beat_id)});

    InquiryReceipt receipt;
    receipt.inquiry_id = record.id;
    receipt.message    = "Inquiry submitted successfully";
    return receipt;
  });
}

BeatView CatalogService::AddBeat(db::model::BeatRecord record) {
  return ObserveCall("CatalogService.AddBeat", [&] {
    if (record.file_name.empty()) {
      throw util::InvalidArgument("file name is required");
    }
    for (const auto* text : {&record.file_name, &record.title, &record.slug}) {
      if (!catalog::IsValidUtf8(*text)) {
        throw util::InvalidArgument("beat fields must be valid UTF-8");
      }
    }
    for (const auto* text : {&record.description, &record.genre}) {
      if (text->has_value() && !catalog::IsValidUtf8(**text)) {
        throw util::InvalidArgument("beat fields must be valid UTF-8");
      }
    }
    if (record.title.empty()) record.title = catalog::DeriveTitle(record.file_name);
    if (record.slug.empty()) record.slug = catalog::DeriveSlug(record.title);
    if (record.file_type.empty()) record.file_type = catalog::DeriveFileType(record.file_name);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->InsertBeat(*tx, record), "insert beat " + record.file_name);
    tx->Commit();

    return ToBeatView(std::move(record));
  });
}

catalog::SyncReport CatalogService::Sync() {
  return ObserveCall("CatalogService.Sync", [&] {
    if (!ctx_.synchronizer) {
      throw std::runtime_error("sync requested but no audio folder is configured");
    }
    return ctx_.synchronizer->Sync();
  });
}

std::vector<db::model::InquiryRecord> CatalogService::ListInquiries(std::optional<int64_t> beat_id) {
  return ObserveCall("CatalogService.ListInquiries", [&] {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListInquiries(*tx, beat_id);
    tx->Commit();
    return records;
  });
}

void CatalogService::UpdateInquiryStatus(int64_t inquiry_id, const std::string& status) {
  ObserveCall("CatalogService.UpdateInquiryStatus", [&] {
    if (status.empty()) {
      throw util::InvalidArgument("status must not be empty");
    }

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpdateInquiryStatus(*tx, inquiry_id, status), "update inquiry status");
    tx->Commit();
  });
}

} // namespace beatstore::service
