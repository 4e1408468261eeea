#include "http_message.hpp"

#include <charconv>
#include <sstream>

#include "internal/catalog/naming.hpp"
#include "internal/http/url.hpp"
#include "internal/util/errors.hpp"

namespace beatstore::http {

namespace {

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

bool HasHeader(const Headers& headers, const std::string& name) {
  const auto wanted = catalog::ToLowerAscii(name);
  for (const auto& [key, _] : headers) {
    if (catalog::ToLowerAscii(key) == wanted) return true;
  }
  return false;
}

} // namespace

std::optional<std::string> HttpRequest::Header(const std::string& name) const {
  const auto wanted = catalog::ToLowerAscii(name);
  for (const auto& [key, value] : headers) {
    if (catalog::ToLowerAscii(key) == wanted) return value;
  }
  return std::nullopt;
}

void HttpResponse::SetHeader(std::string name, std::string value) {
  const auto wanted = catalog::ToLowerAscii(name);
  for (auto& [key, existing] : headers) {
    if (catalog::ToLowerAscii(key) == wanted) {
      existing = std::move(value);
      return;
    }
  }
  headers.emplace_back(std::move(name), std::move(value));
}

std::string ReasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    default: return "Unknown";
  }
}

std::string SerializeHead(const HttpResponse& response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << ' ' << ReasonPhrase(response.status) << "\r\n";
  for (const auto& [key, value] : response.headers) {
    out << key << ": " << value << "\r\n";
  }
  if (!HasHeader(response.headers, "Content-Length")) {
    out << "Content-Length: " << (response.file ? response.file->size : response.body.size()) << "\r\n";
  }
  out << "Connection: close\r\n\r\n";
  return out.str();
}

HttpRequest ParseRequestHead(const std::string& head) {
  std::istringstream in(head);
  std::string        line;

  if (!std::getline(in, line)) {
    throw util::InvalidArgument("empty request");
  }
  if (!line.empty() && line.back() == '\r') line.pop_back();

  HttpRequest request;
  std::string version;
  {
    std::istringstream request_line(line);
    if (!(request_line >> request.method >> request.target >> version) || version.rfind("HTTP/1.", 0) != 0) {
      throw util::InvalidArgument("malformed request line");
    }
  }

  const auto query = request.target.find('?');
  request.path     = PercentDecode(request.target.substr(0, query));

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) break;

    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      throw util::InvalidArgument("malformed header line");
    }
    request.headers.emplace_back(line.substr(0, colon), Trim(line.substr(colon + 1)));
  }

  return request;
}

std::size_t ContentLength(const HttpRequest& request) {
  const auto value = request.Header("Content-Length");
  if (!value) return 0;

  std::size_t length = 0;
  const auto* first  = value->data();
  const auto* last   = value->data() + value->size();
  auto [end, ec]     = std::from_chars(first, last, length);
  if (value->empty() || ec != std::errc() || end != last) {
    throw util::InvalidArgument("invalid Content-Length");
  }
  return length;
}

} // namespace beatstore::http
