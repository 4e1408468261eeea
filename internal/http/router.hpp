#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "http_message.hpp"

namespace beatstore::media { class AudioLibrary; }
namespace beatstore::service { class CatalogService; }

namespace beatstore::http {

/*
  Maps HTTP requests onto the catalog service and the audio library.

    GET     /api/beats            list
    GET     /api/beats/{id}       single beat
    GET     /api/audio/{name}     audio bytes (streamed by the server)
    POST    /api/inquiry          exclusive-rights inquiry
    GET     / , /index.html       static index page
    OPTIONS *                     CORS preflight

  Handle never throws: service exceptions become {error} responses.
*/
class Router {
 public:
  Router(std::shared_ptr<service::CatalogService> catalog,
         std::shared_ptr<media::AudioLibrary>     audio,
         std::filesystem::path                    static_root);

  HttpResponse Handle(const HttpRequest& request) const;

 private:
  HttpResponse Dispatch(const HttpRequest& request) const;

  HttpResponse ListBeats() const;
  HttpResponse GetBeat(const std::string& id_text) const;
  HttpResponse GetAudio(const std::string& file_name) const;
  HttpResponse SubmitInquiry(const HttpRequest& request) const;
  HttpResponse ServeIndex() const;

  std::shared_ptr<service::CatalogService> catalog_;
  std::shared_ptr<media::AudioLibrary>     audio_;
  std::filesystem::path                    static_root_;
};

HttpResponse JsonResponse(int status, std::string body);
HttpResponse ErrorResponse(int status, const std::string& message);

} // namespace beatstore::http
