#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/media/audio_library.hpp"

namespace beatstore::http {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method;
  std::string target; // raw request target, query included
  std::string path;   // percent-decoded, query stripped
  Headers     headers;
  std::string body;

  // Case-insensitive lookup.
  std::optional<std::string> Header(const std::string& name) const;
};

struct HttpResponse {
  int         status = 200;
  Headers     headers;
  std::string body;

  // When set, the file is streamed after the head instead of body.
  std::optional<media::AudioFile> file;

  void SetHeader(std::string name, std::string value);
};

std::string ReasonPhrase(int status);

// Status line and headers, Content-Length and Connection included.
std::string SerializeHead(const HttpResponse& response);

/*
  Parses the request line and headers of an HTTP/1.x head (everything up to
  and including the blank line). Throws util::InvalidArgument when malformed.
*/
HttpRequest ParseRequestHead(const std::string& head);

// Content-Length of the request; 0 when absent. Throws util::InvalidArgument.
std::size_t ContentLength(const HttpRequest& request);

} // namespace beatstore::http
