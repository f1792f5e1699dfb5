#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sqlite_mcp {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Append "?k=v&k2=v2" (keys and values percent-encoded) to `path`.
// Returns `path` unchanged when `params` is empty.
std::string WithQuery(const std::string& path, const QueryParams& params);

} // namespace sqlite_mcp
