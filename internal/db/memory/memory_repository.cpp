#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace beatstore::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertBeat(Transaction& t, model::BeatRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.beat_by_slug.contains(r.slug)) {
    return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: beats.slug");
  }
  if (s.beat_by_file_name.contains(r.file_name)) {
    return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: beats.file_name");
  }

  r.id            = s.next_beat_id++;
  r.created_at_ms = util::NowUnixMillis();
  s.beats[r.id]   = r;
  s.beat_by_slug[r.slug]           = r.id;
  s.beat_by_file_name[r.file_name] = r.id;
  return Result::Ok();
}

std::optional<model::BeatRecord> MemoryRepository::GetBeat(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.beats.find(id);
  if (it == s.beats.end()) return std::nullopt;
  return it->second;
}

std::optional<model::BeatRecord> MemoryRepository::FindBeatByFileName(Transaction& t, const std::string& file_name) {
  const auto& s  = TX(t).View();
  auto        it = s.beat_by_file_name.find(file_name);
  if (it == s.beat_by_file_name.end()) return std::nullopt;
  return s.beats.at(it->second);
}

std::vector<model::BeatRecord> MemoryRepository::ListBeats(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::BeatRecord> records;
  records.reserve(s.beats.size());
  for (const auto& [_, record] : s.beats) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  return records;
}

Result MemoryRepository::InsertInquiry(Transaction& t, model::InquiryRecord& r) {
  auto& s = TX(t).Mutable();
  r.id            = s.next_inquiry_id++;
  r.status        = model::kInquiryStatusNew;
  r.created_at_ms = util::NowUnixMillis();
  s.inquiries[r.id] = r;
  return Result::Ok();
}

std::optional<model::InquiryRecord> MemoryRepository::GetInquiry(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.inquiries.find(id);
  if (it == s.inquiries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::InquiryRecord> MemoryRepository::ListInquiries(Transaction& t, std::optional<int64_t> beat_id) {
  const auto&                       s = TX(t).View();
  std::vector<model::InquiryRecord> records;
  for (auto it = s.inquiries.rbegin(); it != s.inquiries.rend(); ++it) {
    if (beat_id && it->second.beat_id != *beat_id) continue;
    records.push_back(it->second);
  }
  return records;
}

Result MemoryRepository::UpdateInquiryStatus(Transaction& t, int64_t id, const std::string& status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.inquiries.find(id);
  if (it == s.inquiries.end()) {
    return Result::Err(ErrorCode::NotFound, "inquiry " + std::to_string(id) + " not found");
  }
  it->second.status = status;
  return Result::Ok();
}

} // namespace beatstore::db::memory
