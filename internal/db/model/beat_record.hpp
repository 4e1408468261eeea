#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace beatstore::db::model {

/*
  Persistent beat row.

  IMPORTANT:
  - file_name is the natural key used by folder sync for dedup.
  - slug and file_name are both unique across the catalog.
  - Optional fields are reserved for manual curation; sync leaves them empty.
*/

struct BeatRecord {
  int64_t id = 0; // assigned by the store

  std::string title;
  std::string slug;

  std::optional<std::string> description;
  std::optional<std::string> genre;
  std::optional<int64_t>     bpm;
  std::optional<int64_t>     duration;

  std::string file_name;
  std::string file_type;

  // set at insertion (epoch ms), immutable
  uint64_t created_at_ms = 0;
};

} // namespace beatstore::db::model
