#include <sqlite_mcp/slack/slack_session.hpp>

#include <sqlite_mcp/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace sqlite_mcp {

namespace {

Error MakeTransportError(const std::string& operation,
                         const std::string& endpoint,
                         httplib::Error error) {
    const auto category = (error == httplib::Error::ConnectionTimeout ||
                           error == httplib::Error::Read)
                              ? ErrorCategory::Timeout
                              : ErrorCategory::Connection;
    return Error{operation, endpoint, std::nullopt,
                 httplib::to_string(error),
                 std::nullopt, category};
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& hdrs) {
    httplib::Headers result;
    for (const auto& [key, value] : hdrs) {
        result.emplace(key, value);
    }
    return result;
}

bool IsSensitiveHeader(const std::string& key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie";
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

struct SlackSession::Impl {
    std::unique_ptr<httplib::Client> client;

    Impl(const std::string& base_url, const SlackSessionOptions& options)
        : client(std::make_unique<httplib::Client>(base_url)) {
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_write_timeout(options.read_timeout);
    }
};

SlackSession::SlackSession(const std::string& base_url,
                           const SlackSessionOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

SlackSession::~SlackSession() = default;

Result<HttpResponse, Error> SlackSession::Get(std::string_view path,
                                              const HttpHeaders& headers) {
    const std::string target(path);
    auto hdrs = ToHttplibHeaders(headers);
    LogInfo("http", "GET " + target);
    LogRequestHeaders(hdrs);

    auto res = impl_->client->Get(target, hdrs);
    if (!res) {
        return Result<HttpResponse, Error>::Err(
            MakeTransportError("Get", target, res.error()));
    }
    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

Result<HttpResponse, Error> SlackSession::Post(std::string_view path,
                                               std::string_view body,
                                               std::string_view content_type,
                                               const HttpHeaders& headers) {
    const std::string target(path);
    auto hdrs = ToHttplibHeaders(headers);
    LogInfo("http", "POST " + target);
    LogRequestHeaders(hdrs);

    auto res = impl_->client->Post(target, hdrs, std::string(body),
                                   std::string(content_type));
    if (!res) {
        return Result<HttpResponse, Error>::Err(
            MakeTransportError("Post", target, res.error()));
    }
    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace sqlite_mcp
