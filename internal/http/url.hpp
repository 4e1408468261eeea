#pragma once

#include <string>
#include <string_view>

namespace beatstore::http {

// %XX sequences decoded; malformed escapes are kept literally. '+' is left alone.
std::string PercentDecode(std::string_view text);

// Encodes everything except unreserved characters and '/'.
std::string PercentEncodePath(std::string_view path);

} // namespace beatstore::http
