#include <sqlite_mcp/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace sqlite_mcp {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string WithQuery(const std::string& path, const QueryParams& params) {
    if (params.empty()) return path;
    std::string out = path;
    char sep = path.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        out += sep;
        out += UrlEncode(key);
        out += '=';
        out += UrlEncode(value);
        sep = '&';
    }
    return out;
}

} // namespace sqlite_mcp
