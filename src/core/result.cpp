#include <sqlite_mcp/core/result.hpp>

#include <sstream>

namespace sqlite_mcp {

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code) {
    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 401:
        case 403:
            category = ErrorCategory::Authentication;
            message = "Authentication failed: check the bot token";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Timeout;
            message = "Rate limited: retry later";
            break;
        case 500:
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Upstream;
            message = "Messaging platform unavailable";
            break;
        default:
            category = ErrorCategory::Upstream;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, std::nullopt, category};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Configuration:  return 2;
        case ErrorCategory::Connection:     return 3;
        case ErrorCategory::Statement:
        case ErrorCategory::NotFound:       return 4;
        case ErrorCategory::Authentication: return 5;
        case ErrorCategory::Timeout:        return 6;
        case ErrorCategory::Upstream:       return 7;
        case ErrorCategory::Internal:       break;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Connection:     return "connection";
        case ErrorCategory::Statement:      return "statement";
        case ErrorCategory::NotFound:       return "not_found";
        case ErrorCategory::Authentication: return "authentication";
        case ErrorCategory::Timeout:        return "timeout";
        case ErrorCategory::Configuration:  return "configuration";
        case ErrorCategory::Upstream:       return "upstream";
        case ErrorCategory::Internal:       break;
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    // Platform codes usually are the message; only add them when they differ.
    if (platform_error && !platform_error->empty() && *platform_error != message) {
        oss << " (" << *platform_error << ")";
    }
    return oss.str();
}

} // namespace sqlite_mcp
