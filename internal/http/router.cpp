#include "router.hpp"

#include <stdexcept>
#include <system_error>

#include "internal/http/http_error.hpp"
#include "internal/http/json_codec.hpp"
#include "internal/media/audio_library.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/catalog_service.hpp"

namespace beatstore::http {

using beatstore::observability::IntField;
using beatstore::observability::StringField;

namespace {

constexpr const char* kBeatsRoute   = "/api/beats";
constexpr const char* kInquiryRoute = "/api/inquiry";

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

void ApplyCors(HttpResponse& response) {
  response.SetHeader("Access-Control-Allow-Origin", "*");
}

} // namespace

HttpResponse JsonResponse(int status, std::string body) {
  HttpResponse response;
  response.status = status;
  response.body   = std::move(body);
  response.SetHeader("Content-Type", "application/json");
  return response;
}

// Runs inside Handle's catch, so it must not throw itself.
HttpResponse ErrorResponse(int status, const std::string& message) {
  try {
    return JsonResponse(status, ErrorJson(message));
  } catch (const std::runtime_error& e) {
    BEATSTORE_LOG_WARN("error message not serializable", {IntField("status", status), StringField("error", e.what())});
    return JsonResponse(status, R"({"error":"Request failed"})");
  }
}

Router::Router(std::shared_ptr<service::CatalogService> catalog,
               std::shared_ptr<media::AudioLibrary>     audio,
               std::filesystem::path                    static_root)
    : catalog_(std::move(catalog)), audio_(std::move(audio)), static_root_(std::move(static_root)) {
  if (!catalog_ || !audio_) {
    throw std::invalid_argument("router requires a catalog service and an audio library");
  }
}

HttpResponse Router::Handle(const HttpRequest& request) const {
  HttpResponse response;
  try {
    response = Dispatch(request);
  } catch (const std::exception& e) {
    const int status = ToStatus(e);
    if (IsClientError(status)) {
      response = ErrorResponse(status, e.what());
    } else {
      BEATSTORE_LOG_ERROR("request failed", {StringField("method", request.method), StringField("path", request.path),
                                             StringField("error", e.what())});
      response = ErrorResponse(status, "Internal server error");
    }
  }

  ApplyCors(response);

  if (response.status >= 500) {
    BEATSTORE_LOG_ERROR("http", {StringField("method", request.method), StringField("path", request.path),
                                 IntField("status", response.status)});
  } else {
    BEATSTORE_LOG_INFO("http", {StringField("method", request.method), StringField("path", request.path),
                                IntField("status", response.status)});
  }
  return response;
}

HttpResponse Router::Dispatch(const HttpRequest& request) const {
  const auto& path = request.path;

  if (request.method == "OPTIONS") {
    HttpResponse response;
    response.SetHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.SetHeader("Access-Control-Allow-Headers", "Content-Type");
    return response;
  }

  const std::string beat_prefix = std::string(kBeatsRoute) + "/";

  if (path == kBeatsRoute || path == beat_prefix) {
    if (request.method != "GET") return ErrorResponse(405, "Method not allowed");
    return ListBeats();
  }

  if (StartsWith(path, beat_prefix)) {
    const auto id_text = path.substr(beat_prefix.size());
    if (id_text.find('/') != std::string::npos) {
      return ErrorResponse(404, "Not found");
    }
    if (request.method != "GET") return ErrorResponse(405, "Method not allowed");
    return GetBeat(id_text);
  }

  if (StartsWith(path, service::kAudioRoutePrefix)) {
    const auto file_name = path.substr(std::string(service::kAudioRoutePrefix).size());
    if (file_name.empty()) {
      return ErrorResponse(404, "Not found");
    }
    if (request.method != "GET") return ErrorResponse(405, "Method not allowed");
    return GetAudio(file_name);
  }

  if (path == kInquiryRoute) {
    if (request.method != "POST") return ErrorResponse(405, "Method not allowed");
    return SubmitInquiry(request);
  }

  if (path == "/" || path == "/index.html") {
    if (request.method != "GET") return ErrorResponse(405, "Method not allowed");
    return ServeIndex();
  }

  return ErrorResponse(404, "Not found");
}

HttpResponse Router::ListBeats() const {
  return JsonResponse(200, BeatListJson(catalog_->ListBeats()));
}

HttpResponse Router::GetBeat(const std::string& id_text) const {
  return JsonResponse(200, BeatJson(catalog_->GetBeat(id_text)));
}

HttpResponse Router::GetAudio(const std::string& file_name) const {
  HttpResponse response;
  response.file = audio_->Resolve(file_name);
  response.SetHeader("Content-Type", response.file->content_type);
  response.SetHeader("Accept-Ranges", "bytes");
  return response;
}

HttpResponse Router::SubmitInquiry(const HttpRequest& request) const {
  const auto input   = DecodeInquiry(request.body);
  const auto receipt = catalog_->SubmitInquiry(input);
  return JsonResponse(200, InquiryReceiptJson(receipt));
}

HttpResponse Router::ServeIndex() const {
  if (static_root_.empty()) {
    return ErrorResponse(404, "Not found");
  }

  const auto      index = static_root_ / "index.html";
  std::error_code ec;
  if (!std::filesystem::is_regular_file(index, ec)) {
    return ErrorResponse(404, "Not found");
  }
  const auto size = std::filesystem::file_size(index, ec);
  if (ec) {
    return ErrorResponse(404, "Not found");
  }

  HttpResponse response;
  response.file = media::AudioFile{index, size, "text/html; charset=utf-8"};
  response.SetHeader("Content-Type", response.file->content_type);
  return response;
}

} // namespace beatstore::http
