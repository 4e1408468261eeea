#include "internal/service/catalog_service.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using beatstore::service::CatalogService;
using beatstore::service::InquiryInput;
using beatstore::service::ServiceContext;

struct Fixture {
  std::shared_ptr<beatstore::db::memory::MemoryRepository> repository;
  std::filesystem::path                                    audio_root;
  std::unique_ptr<CatalogService>                          service;
};

Fixture BuildFixture(const std::string& test_name, bool sync_on_list = true) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();

  Fixture fixture;
  fixture.repository = std::make_shared<beatstore::db::memory::MemoryRepository>();
  fixture.audio_root = std::filesystem::temp_directory_path() / "beatstore_catalog_service_tests" /
                       (test_name + "_" + std::to_string(stamp));
  std::filesystem::create_directories(fixture.audio_root);

  ServiceContext ctx;
  ctx.repository   = fixture.repository;
  ctx.synchronizer = std::make_shared<beatstore::catalog::FolderSynchronizer>(fixture.repository, fixture.audio_root);
  ctx.sync_on_list = sync_on_list;
  fixture.service  = std::make_unique<CatalogService>(ctx);
  return fixture;
}

void Touch(const std::filesystem::path& path) {
  std::ofstream out(path, std::ios::binary);
  out << "RIFF";
}

size_t CountInquiries(Fixture& fixture) {
  return fixture.service->ListInquiries(std::nullopt).size();
}

InquiryInput ValidInput() {
  InquiryInput input;
  input.beat_id = 1;
  input.name    = "Ana";
  input.email   = "a@b.com";
  input.offer   = "$500";
  return input;
}

template <typename Exception, typename Fn>
std::string ExpectThrows(Fn&& fn) {
  try {
    fn();
  } catch (const Exception& e) {
    return e.what();
  }
  assert(false && "expected exception");
  return {};
}

void TestListSyncsFolderAndBuildsAudioUrls() {
  auto fixture = BuildFixture("list_sync");
  Touch(fixture.audio_root / "Night Drive.mp3");

  auto beats = fixture.service->ListBeats();
  assert(beats.size() == 1);
  assert(beats[0].beat.slug == "night-drive");
  assert(beats[0].file_url == "/api/audio/Night Drive.mp3");

  Touch(fixture.audio_root / "second.wav");
  assert(fixture.service->ListBeats().size() == 2);
}

void TestListWithoutSyncOnListSeesOnlyCatalogue() {
  auto fixture = BuildFixture("no_sync_on_list", false);
  Touch(fixture.audio_root / "later.mp3");

  assert(fixture.service->ListBeats().empty());
  auto report = fixture.service->Sync();
  assert(report.inserted == 1);
  assert(fixture.service->ListBeats().size() == 1);
}

void TestGetBeatRejectsMalformedIds() {
  auto fixture = BuildFixture("get_invalid");

  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->GetBeat("abc"); });
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->GetBeat("1x"); });
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->GetBeat(""); });
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->GetBeat("-3"); });
  auto message = ExpectThrows<beatstore::util::NotFound>([&] { fixture.service->GetBeat("42"); });
  assert(message == "Beat not found");
}

void TestGetBeatReturnsCataloguedRow() {
  auto fixture = BuildFixture("get_found");
  Touch(fixture.audio_root / "loop.ogg");
  auto listed = fixture.service->ListBeats();

  auto view = fixture.service->GetBeat(std::to_string(listed[0].beat.id));
  assert(view.beat.file_name == "loop.ogg");
  assert(view.beat.file_type == "ogg");
}

void TestInquiryWithBadEmailWritesNothing() {
  auto fixture = BuildFixture("bad_email");

  auto input  = ValidInput();
  input.email = "not-an-email";
  auto message = ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->SubmitInquiry(input); });
  assert(message == "Invalid email format");
  assert(CountInquiries(fixture) == 0);
}

void TestInquiryWithMissingFieldsWritesNothing() {
  auto fixture = BuildFixture("missing_fields");

  auto no_name = ValidInput();
  no_name.name.reset();
  auto message = ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->SubmitInquiry(no_name); });
  assert(message == "Missing required fields");

  auto empty_offer  = ValidInput();
  empty_offer.offer = "";
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->SubmitInquiry(empty_offer); });

  auto no_beat = ValidInput();
  no_beat.beat_id.reset();
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->SubmitInquiry(no_beat); });

  assert(CountInquiries(fixture) == 0);
}

void TestValidInquiryIsStoredAsNew() {
  auto fixture = BuildFixture("valid_inquiry");

  auto receipt = fixture.service->SubmitInquiry(ValidInput());
  assert(receipt.inquiry_id > 0);
  assert(receipt.message == "Inquiry submitted successfully");

  auto inquiries = fixture.service->ListInquiries(std::nullopt);
  assert(inquiries.size() == 1);
  assert(inquiries[0].status == "new");
  assert(inquiries[0].email == "a@b.com");

  // beat ids are not checked against the catalogue
  auto orphan    = ValidInput();
  orphan.beat_id = 777;
  fixture.service->SubmitInquiry(orphan);
  assert(fixture.service->ListInquiries(777).size() == 1);
}

void TestUpdateInquiryStatus() {
  auto fixture = BuildFixture("update_status");
  auto receipt = fixture.service->SubmitInquiry(ValidInput());

  fixture.service->UpdateInquiryStatus(receipt.inquiry_id, "replied");
  assert(fixture.service->ListInquiries(std::nullopt)[0].status == "replied");

  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->UpdateInquiryStatus(receipt.inquiry_id, ""); });
  ExpectThrows<beatstore::util::NotFound>([&] { fixture.service->UpdateInquiryStatus(receipt.inquiry_id + 50, "x"); });
}

void TestAddBeatDerivesFieldsAndRejectsDuplicates() {
  auto fixture = BuildFixture("add_beat", false);

  beatstore::db::model::BeatRecord record;
  record.file_name = "Sunset Vibes.wav";
  record.genre     = "lofi";
  record.bpm       = 85;
  auto view        = fixture.service->AddBeat(record);
  assert(view.beat.id > 0);
  assert(view.beat.title == "Sunset Vibes");
  assert(view.beat.slug == "sunset-vibes");
  assert(view.beat.file_type == "wav");

  ExpectThrows<beatstore::util::AlreadyExists>([&] { fixture.service->AddBeat(record); });

  beatstore::db::model::BeatRecord unnamed;
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->AddBeat(unnamed); });
}

void TestAddBeatRejectsNonUtf8Text() {
  auto fixture = BuildFixture("add_beat_utf8", false);

  beatstore::db::model::BeatRecord bad_name;
  bad_name.file_name = "bad\xff.mp3";
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->AddBeat(bad_name); });

  beatstore::db::model::BeatRecord bad_genre;
  bad_genre.file_name = "fine.mp3";
  bad_genre.genre     = std::string("lo\xfe");
  ExpectThrows<beatstore::util::InvalidArgument>([&] { fixture.service->AddBeat(bad_genre); });

  assert(fixture.service->ListBeats().empty());
}

} // namespace

int main() {
  TestListSyncsFolderAndBuildsAudioUrls();
  TestListWithoutSyncOnListSeesOnlyCatalogue();
  TestGetBeatRejectsMalformedIds();
  TestGetBeatReturnsCataloguedRow();
  TestInquiryWithBadEmailWritesNothing();
  TestInquiryWithMissingFieldsWritesNothing();
  TestValidInquiryIsStoredAsNew();
  TestUpdateInquiryStatus();
  TestAddBeatDerivesFieldsAndRejectsDuplicates();
  TestAddBeatRejectsNonUtf8Text();

  std::cout << "beatstore_unit_catalog_service: pass\n";
  return 0;
}
