#pragma once

#include <sqlite_mcp/slack/i_slack_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace sqlite_mcp {

struct SlackSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{10};
};

// ---------------------------------------------------------------------------
// SlackSession: ISlackSession over cpp-httplib.
//
// `base_url` is scheme://host[:port], e.g. "https://slack.com". The client
// is pimpl'd so httplib does not leak into this header. Credentials are
// not held here; each request carries its own Authorization header.
// ---------------------------------------------------------------------------
class SlackSession : public ISlackSession {
public:
    explicit SlackSession(const std::string& base_url,
                          const SlackSessionOptions& options = {});
    ~SlackSession() override;

    SlackSession(const SlackSession&) = delete;
    SlackSession& operator=(const SlackSession&) = delete;
    SlackSession(SlackSession&&) = delete;
    SlackSession& operator=(SlackSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlite_mcp
