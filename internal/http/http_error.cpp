#include "http_error.hpp"

namespace beatstore::http {

int ToStatus(const std::exception& e) {
  using namespace beatstore::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return 400;
  }
  if (dynamic_cast<const AccessDenied*>(&e)) {
    return 403;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return 404;
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return 409;
  }

  return 500;
}

} // namespace beatstore::http
