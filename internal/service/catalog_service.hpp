#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/catalog/folder_sync.hpp"
#include "internal/db/model/beat_record.hpp"
#include "internal/db/model/inquiry_record.hpp"
#include "service_context.hpp"

namespace beatstore::service {

inline constexpr const char* kAudioRoutePrefix = "/api/audio/";

// Beat plus its audio locator ("/api/audio/" + file name, not yet encoded).
struct BeatView {
  db::model::BeatRecord beat;
  std::string           file_url;
};

// Raw submission; an absent optional is a missing field.
struct InquiryInput {
  std::optional<int64_t>     beat_id;
  std::optional<std::string> name;
  std::optional<std::string> email;
  std::optional<std::string> offer;
};

struct InquiryReceipt {
  int64_t     inquiry_id = 0;
  std::string message;
};

/*
  Single entry point used by the transport and the admin CLI.

  Failures surface as util:: exceptions (NotFound, InvalidArgument,
  AlreadyExists); anything else is an internal error.
*/
class CatalogService {
public:
  explicit CatalogService(ServiceContext ctx);

  std::vector<BeatView> ListBeats();

  // id_text must be a positive decimal integer.
  BeatView GetBeat(std::string_view id_text);

  InquiryReceipt SubmitInquiry(const InquiryInput& input);

  // Explicit add; slug and file type are derived when left empty.
  BeatView AddBeat(db::model::BeatRecord record);

  catalog::SyncReport Sync();

  std::vector<db::model::InquiryRecord> ListInquiries(std::optional<int64_t> beat_id);

  void UpdateInquiryStatus(int64_t inquiry_id, const std::string& status);

private:
  ServiceContext ctx_;
};

}
