#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "fileserve/core/source.hpp"

namespace fileserve::http_date {

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string format(FileTime time);

// Accepts the three HTTP-date forms:
//   IMF-fixdate  "Sun, 06 Nov 1994 08:49:37 GMT"
//   RFC 850      "Sunday, 06-Nov-94 08:49:37 GMT"
//   asctime      "Sun Nov  6 08:49:37 1994"
// Returns nullopt for anything else, including out-of-range fields.
std::optional<FileTime> parse(std::string_view text);

} // namespace fileserve::http_date
