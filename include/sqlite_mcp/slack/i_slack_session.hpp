#pragma once

#include <sqlite_mcp/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace sqlite_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders: header name to value. Names are compared as given; callers
// normalise case when they need to.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// ISlackSession: abstract HTTP session against the messaging platform API.
//
// The messaging operations depend on this interface, not on an HTTP
// client, so they can be tested offline with MockSlackSession.
// Transport failures come back as Err; any HTTP status is an Ok response.
// ---------------------------------------------------------------------------
class ISlackSession {
public:
    virtual ~ISlackSession() = default;

    ISlackSession(const ISlackSession&) = delete;
    ISlackSession& operator=(const ISlackSession&) = delete;
    ISlackSession(ISlackSession&&) = delete;
    ISlackSession& operator=(ISlackSession&&) = delete;

    // `path` may carry a query string.
    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

protected:
    ISlackSession() = default;
};

} // namespace sqlite_mcp
