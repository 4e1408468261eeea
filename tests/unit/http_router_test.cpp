#include "internal/http/router.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/catalog/folder_sync.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/http/url.hpp"
#include "internal/media/audio_library.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using beatstore::http::HttpRequest;
using beatstore::http::HttpResponse;
using beatstore::http::Router;
using google::protobuf::Value;

struct Fixture {
  std::filesystem::path                                    base;
  std::filesystem::path                                    audio_root;
  std::shared_ptr<beatstore::db::memory::MemoryRepository> repository;
  std::shared_ptr<beatstore::service::CatalogService>      catalog;
  std::unique_ptr<Router>                                  router;
};

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

Fixture BuildFixture(const std::string& test_name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();

  Fixture fixture;
  fixture.base       = std::filesystem::temp_directory_path() / "beatstore_http_router_tests" /
                 (test_name + "_" + std::to_string(stamp));
  fixture.audio_root = fixture.base / "beats";
  std::filesystem::create_directories(fixture.audio_root);

  fixture.repository = std::make_shared<beatstore::db::memory::MemoryRepository>();

  beatstore::service::ServiceContext ctx;
  ctx.repository   = fixture.repository;
  ctx.synchronizer = std::make_shared<beatstore::catalog::FolderSynchronizer>(fixture.repository, fixture.audio_root);
  fixture.catalog  = std::make_shared<beatstore::service::CatalogService>(ctx);

  auto audio     = std::make_shared<beatstore::media::AudioLibrary>(fixture.audio_root);
  fixture.router = std::make_unique<Router>(fixture.catalog, audio, fixture.base);
  return fixture;
}

HttpRequest Request(const std::string& method, const std::string& path, const std::string& body = {}) {
  HttpRequest request;
  request.method = method;
  request.target = path;
  request.path   = path;
  request.body   = body;
  return request;
}

std::string HeaderOf(const HttpResponse& response, const std::string& name) {
  for (const auto& [key, value] : response.headers) {
    if (key == name) return value;
  }
  return {};
}

Value ParseJson(const std::string& json) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &value);
  assert(status.ok());
  return value;
}

std::string ErrorOf(const HttpResponse& response) {
  return ParseJson(response.body).struct_value().fields().at("error").string_value();
}

void TestListBeatsShapeAndNulls() {
  auto fixture = BuildFixture("list");
  WriteFile(fixture.audio_root / "Night Drive.mp3", "abc");

  auto response = fixture.router->Handle(Request("GET", "/api/beats"));
  assert(response.status == 200);
  assert(HeaderOf(response, "Content-Type") == "application/json");
  assert(HeaderOf(response, "Access-Control-Allow-Origin") == "*");

  auto list = ParseJson(response.body);
  assert(list.has_list_value());
  assert(list.list_value().values_size() == 1);

  const auto& beat = list.list_value().values(0).struct_value().fields();
  assert(beat.at("id").number_value() == 1);
  assert(beat.at("title").string_value() == "Night Drive");
  assert(beat.at("slug").string_value() == "night-drive");
  assert(beat.at("fileName").string_value() == "Night Drive.mp3");
  assert(beat.at("fileType").string_value() == "mp3");
  assert(beat.at("fileUrl").string_value() == "/api/audio/Night%20Drive.mp3");
  assert(beat.at("genre").kind_case() == Value::kNullValue);
  assert(beat.at("bpm").kind_case() == Value::kNullValue);
  assert(beat.at("description").kind_case() == Value::kNullValue);
  assert(beat.at("duration").kind_case() == Value::kNullValue);
}

void TestEmptyCatalogueIsEmptyArray() {
  auto fixture  = BuildFixture("empty");
  auto response = fixture.router->Handle(Request("GET", "/api/beats"));
  assert(response.status == 200);
  assert(ParseJson(response.body).list_value().values_size() == 0);
}

void TestGetBeatStatuses() {
  auto fixture = BuildFixture("get_beat");
  WriteFile(fixture.audio_root / "loop.ogg", "abc");
  fixture.router->Handle(Request("GET", "/api/beats"));

  auto found = fixture.router->Handle(Request("GET", "/api/beats/1"));
  assert(found.status == 200);
  assert(ParseJson(found.body).struct_value().fields().at("fileName").string_value() == "loop.ogg");

  auto missing = fixture.router->Handle(Request("GET", "/api/beats/99"));
  assert(missing.status == 404);
  assert(ErrorOf(missing) == "Beat not found");

  auto invalid = fixture.router->Handle(Request("GET", "/api/beats/abc"));
  assert(invalid.status == 400);
}

void TestAudioRoute() {
  auto fixture = BuildFixture("audio");
  WriteFile(fixture.audio_root / "My Song.wav", "RIFFdata");

  auto response = fixture.router->Handle(Request("GET", "/api/audio/My Song.wav"));
  assert(response.status == 200);
  assert(response.file.has_value());
  assert(response.file->size == 8);
  assert(HeaderOf(response, "Content-Type") == "audio/wav");
  assert(HeaderOf(response, "Accept-Ranges") == "bytes");

  auto missing = fixture.router->Handle(Request("GET", "/api/audio/nope.mp3"));
  assert(missing.status == 404);
  assert(!missing.file.has_value());

  auto escape = fixture.router->Handle(Request("GET", "/api/audio/../../etc/passwd"));
  assert(escape.status == 403);
  assert(!escape.file.has_value());

  auto root = fixture.router->Handle(Request("GET", "/api/audio/."));
  assert(root.status == 404);

  // a decoded path that is not UTF-8 must not leak into the JSON error
  auto undecodable = fixture.router->Handle(Request("GET", "/api/audio/\xff.mp3"));
  assert(undecodable.status == 404);
  const auto parsed = ParseJson(undecodable.body);
  assert(parsed.struct_value().fields().at("error").string_value() == "audio file not found");
}

void TestErrorResponseNeverThrows() {
  auto response = beatstore::http::ErrorResponse(400, "bad\xff input");
  assert(response.status == 400);
  assert(HeaderOf(response, "Content-Type") == "application/json");
  const auto parsed = ParseJson(response.body);
  assert(parsed.struct_value().fields().count("error") == 1);
}

void TestInquiryRoute() {
  auto fixture = BuildFixture("inquiry");

  auto ok = fixture.router->Handle(
      Request("POST", "/api/inquiry", R"({"beatId": 1, "name": "Ana", "email": "a@b.com", "offer": "$500"})"));
  assert(ok.status == 200);
  const auto  parsed  = ParseJson(ok.body);
  const auto& receipt = parsed.struct_value().fields();
  assert(receipt.at("success").bool_value());
  assert(receipt.at("inquiryId").number_value() == 1);
  assert(receipt.at("message").string_value() == "Inquiry submitted successfully");

  auto string_id = fixture.router->Handle(
      Request("POST", "/api/inquiry", R"({"beatId": "2", "name": "Ana", "email": "a@b.com", "offer": "$1"})"));
  assert(string_id.status == 200);

  auto bad_email = fixture.router->Handle(
      Request("POST", "/api/inquiry", R"({"beatId": 1, "name": "Ana", "email": "not-an-email", "offer": "$500"})"));
  assert(bad_email.status == 400);
  assert(ErrorOf(bad_email) == "Invalid email format");

  auto missing = fixture.router->Handle(Request("POST", "/api/inquiry", R"({"beatId": 1, "name": "Ana"})"));
  assert(missing.status == 400);
  assert(ErrorOf(missing) == "Missing required fields");

  auto malformed = fixture.router->Handle(Request("POST", "/api/inquiry", "{not json"));
  assert(malformed.status == 400);

  auto not_object = fixture.router->Handle(Request("POST", "/api/inquiry", "[1,2]"));
  assert(not_object.status == 400);

  assert(fixture.catalog->ListInquiries(std::nullopt).size() == 2);
}

void TestCorsPreflight() {
  auto fixture  = BuildFixture("cors");
  auto response = fixture.router->Handle(Request("OPTIONS", "/api/inquiry"));
  assert(response.status == 200);
  assert(HeaderOf(response, "Access-Control-Allow-Origin") == "*");
  assert(HeaderOf(response, "Access-Control-Allow-Methods") == "GET, POST, OPTIONS");
  assert(HeaderOf(response, "Access-Control-Allow-Headers") == "Content-Type");
}

void TestUnknownRouteAndWrongMethod() {
  auto fixture = BuildFixture("unknown");

  auto unknown = fixture.router->Handle(Request("GET", "/api/nothing"));
  assert(unknown.status == 404);
  assert(!ErrorOf(unknown).empty());
  assert(HeaderOf(unknown, "Access-Control-Allow-Origin") == "*");

  auto wrong = fixture.router->Handle(Request("DELETE", "/api/beats"));
  assert(wrong.status == 405);
}

void TestIndexPage() {
  auto fixture = BuildFixture("index");

  auto absent = fixture.router->Handle(Request("GET", "/"));
  assert(absent.status == 404);

  WriteFile(fixture.base / "index.html", "<html></html>");
  auto page = fixture.router->Handle(Request("GET", "/index.html"));
  assert(page.status == 200);
  assert(page.file.has_value());
  assert(page.file->size == 13);
  assert(HeaderOf(page, "Content-Type").rfind("text/html", 0) == 0);
}

void TestRequestHeadParsing() {
  auto request = beatstore::http::ParseRequestHead(
      "GET /api/audio/My%20Song.mp3?x=1 HTTP/1.1\r\nHost: localhost\r\ncontent-length: 12\r\n\r\n");
  assert(request.method == "GET");
  assert(request.path == "/api/audio/My Song.mp3");
  assert(request.Header("Content-Length") == std::optional<std::string>("12"));
  assert(beatstore::http::ContentLength(request) == 12);

  bool threw = false;
  try {
    beatstore::http::ParseRequestHead("garbage\r\n\r\n");
  } catch (const beatstore::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestPercentCoding() {
  assert(beatstore::http::PercentDecode("a%20b%2Fc") == "a b/c");
  assert(beatstore::http::PercentDecode("100%") == "100%");
  assert(beatstore::http::PercentDecode("%zz") == "%zz");
  assert(beatstore::http::PercentEncodePath("/api/audio/My Song (v2).mp3") == "/api/audio/My%20Song%20%28v2%29.mp3");
}

void TestResponseHead() {
  auto response = beatstore::http::ErrorResponse(404, "Not found");
  auto head     = beatstore::http::SerializeHead(response);
  assert(head.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
  assert(head.find("Content-Length: " + std::to_string(response.body.size()) + "\r\n") != std::string::npos);
  assert(head.find("Connection: close\r\n\r\n") != std::string::npos);
}

} // namespace

int main() {
  TestListBeatsShapeAndNulls();
  TestEmptyCatalogueIsEmptyArray();
  TestGetBeatStatuses();
  TestAudioRoute();
  TestErrorResponseNeverThrows();
  TestInquiryRoute();
  TestCorsPreflight();
  TestUnknownRouteAndWrongMethod();
  TestIndexPage();
  TestRequestHeadParsing();
  TestPercentCoding();
  TestResponseHead();

  std::cout << "beatstore_unit_http_router: pass\n";
  return 0;
}
