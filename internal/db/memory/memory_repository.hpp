#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace beatstore::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBeat(Transaction&, model::BeatRecord&) override;
  std::optional<model::BeatRecord> GetBeat(Transaction&, int64_t id) override;
  std::optional<model::BeatRecord> FindBeatByFileName(Transaction&, const std::string& file_name) override;
  std::vector<model::BeatRecord> ListBeats(Transaction&) override;

  Result InsertInquiry(Transaction&, model::InquiryRecord&) override;
  std::optional<model::InquiryRecord> GetInquiry(Transaction&, int64_t id) override;
  std::vector<model::InquiryRecord> ListInquiries(Transaction&, std::optional<int64_t> beat_id) override;
  Result UpdateInquiryStatus(Transaction&, int64_t id, const std::string& status) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::BeatRecord> beats;
    std::unordered_map<std::string, int64_t> beat_by_slug;
    std::unordered_map<std::string, int64_t> beat_by_file_name;
    std::map<int64_t, model::InquiryRecord> inquiries;
    int64_t next_beat_id    = 1;
    int64_t next_inquiry_id = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
