#pragma once

#include <cstdint>
#include <string>

namespace beatstore::db::model {

inline constexpr const char* kInquiryStatusNew = "new";

/*
  Exclusive license inquiry.

  beat_id is a soft reference: the store never checks that the beat exists.
*/

struct InquiryRecord {
  int64_t id      = 0;
  int64_t beat_id = 0;

  std::string name;
  std::string email;
  std::string offer;

  std::string status = kInquiryStatusNew;

  uint64_t created_at_ms = 0;
};

} // namespace beatstore::db::model
