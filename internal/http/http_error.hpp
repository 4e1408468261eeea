#pragma once

#include <exception>

#include "internal/util/errors.hpp"

namespace beatstore::http {

/*
  Converts internal exceptions into HTTP status codes.
*/

int ToStatus(const std::exception& e);

// 4xx: the caller's fault, logged without alarm.
inline bool IsClientError(int status) {
  return status >= 400 && status < 500;
}

} // namespace beatstore::http
