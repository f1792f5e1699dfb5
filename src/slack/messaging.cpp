#include <sqlite_mcp/slack/messaging.hpp>

#include <sqlite_mcp/core/log.hpp>
#include <sqlite_mcp/core/url.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <deque>

namespace sqlite_mcp {

namespace {

constexpr const char* kRepliesPath = "/api/conversations.replies";
constexpr const char* kPostMessagePath = "/api/chat.postMessage";

// Progress markers the bot prefixes to its interim messages, as UTF-8
// glyphs and as Slack shortcodes.
constexpr std::array<std::string_view, 14> kStatusMarkers = {
    "\xE2\x8F\xB3",          // U+23F3 hourglass flowing sand
    "\xE2\x8C\x9B",          // U+231B hourglass
    "\xF0\x9F\x94\x84",      // U+1F504 counterclockwise arrows
    "\xF0\x9F\x94\x8D",      // U+1F50D magnifying glass
    "\xE2\x9A\x99",          // U+2699 gear
    "\xF0\x9F\xA4\x94",      // U+1F914 thinking face
    "\xF0\x9F\x92\xAD",      // U+1F4AD thought balloon
    ":hourglass_flowing_sand:",
    ":hourglass:",
    ":arrows_counterclockwise:",
    ":mag:",
    ":gear:",
    ":thinking_face:",
    ":thought_balloon:",
};

HttpHeaders AuthHeaders(const std::string& token) {
    return {{"Authorization", "Bearer " + token}};
}

// Upstream payloads are not trusted to be well-typed: a field of the wrong
// type reads as absent.
std::string StringField(const nlohmann::json& object, const char* key,
                        const std::string& fallback = "") {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool IsSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

// Translate a session-level outcome into a parsed body or a platform error.
Result<nlohmann::json, Error> ParseApiResponse(
    const std::string& operation,
    const std::string& endpoint,
    Result<HttpResponse, Error> response) {
    using R = Result<nlohmann::json, Error>;

    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = operation;
        error.message = "Slack API request failed: " + error.message;
        return R::Err(std::move(error));
    }

    const auto& http = response.Value();
    if (!IsSuccessStatus(http.status_code)) {
        auto error = Error::FromHttpStatus(operation, endpoint, http.status_code);
        error.message = "HTTP " + std::to_string(http.status_code) + ": " + error.message;
        return R::Err(std::move(error));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(http.body);
    } catch (const nlohmann::json::exception& e) {
        return R::Err(Error{operation, endpoint, http.status_code,
                            std::string("Invalid response from Slack API: ") + e.what(),
                            std::nullopt, ErrorCategory::Upstream});
    }

    const bool ok = body.is_object() && body.contains("ok") &&
                    body["ok"].is_boolean() && body["ok"].get<bool>();
    if (!ok) {
        const std::string code = body.is_object()
                                     ? StringField(body, "error", "unknown_error")
                                     : std::string("unknown_error");
        const auto category = (code == "not_authed" || code == "invalid_auth" ||
                               code == "token_revoked" || code == "account_inactive")
                                  ? ErrorCategory::Authentication
                                  : ErrorCategory::Upstream;
        return R::Err(Error{operation, endpoint, http.status_code, code, code, category});
    }

    return R::Ok(std::move(body));
}

// Empty when the thread has no further page.
std::string NextCursor(const nlohmann::json& body) {
    auto meta = body.find("response_metadata");
    if (meta == body.end() || !meta->is_object()) return "";
    return StringField(*meta, "next_cursor");
}

bool IsBotAuthored(const nlohmann::json& message) {
    if (message.contains("bot_id") && !message["bot_id"].is_null()) {
        return true;
    }
    return StringField(message, "subtype") == "bot_message";
}

} // anonymous namespace

const char* RoleName(MessageRole role) {
    switch (role) {
        case MessageRole::User:      return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

bool IsStatusMarker(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return false;
    text.remove_prefix(first);
    for (const auto marker : kStatusMarkers) {
        if (text.substr(0, marker.size()) == marker) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// ReadThread
// ---------------------------------------------------------------------------
Result<std::vector<ThreadMessage>, Error> ReadThread(ISlackSession& session,
                                                     const std::string& token,
                                                     const std::string& channel,
                                                     const std::string& thread_ts,
                                                     int limit) {
    using R = Result<std::vector<ThreadMessage>, Error>;

    const std::size_t keep = limit > 0 ? static_cast<std::size_t>(limit) : 0;
    if (keep == 0) return R::Ok(std::vector<ThreadMessage>{});

    // Sliding window over the thread, newest `keep` raw messages.
    std::deque<nlohmann::json> window;
    std::string cursor;
    int pages = 0;
    do {
        QueryParams params = {{"channel", channel},
                              {"ts", thread_ts},
                              {"limit", std::to_string(kMaxThreadLimit)}};
        if (!cursor.empty()) params.emplace_back("cursor", cursor);

        auto parsed = ParseApiResponse("ReadThread", kRepliesPath,
                                       session.Get(WithQuery(kRepliesPath, params),
                                                   AuthHeaders(token)));
        if (parsed.IsErr()) return R::Err(std::move(parsed).Error());
        auto body = std::move(parsed).Value();
        ++pages;

        auto raw = body.find("messages");
        if (raw != body.end() && raw->is_array()) {
            for (auto& m : *raw) {
                window.push_back(std::move(m));
                if (window.size() > keep) window.pop_front();
            }
        }

        auto next = NextCursor(body);
        if (!next.empty() && next == cursor) {
            return R::Err(Error{"ReadThread", kRepliesPath, std::nullopt,
                                "Slack API returned a repeating page cursor",
                                std::nullopt, ErrorCategory::Upstream});
        }
        cursor = std::move(next);
    } while (!cursor.empty());

    std::vector<ThreadMessage> messages;
    std::size_t filtered = 0;
    for (const auto& m : window) {
        if (!m.is_object()) continue;
        auto text = StringField(m, "text");
        if (IsStatusMarker(text)) {
            ++filtered;
            continue;
        }
        ThreadMessage msg;
        msg.role = IsBotAuthored(m) ? MessageRole::Assistant : MessageRole::User;
        msg.text = std::move(text);
        msg.ts = StringField(m, "ts");
        messages.push_back(std::move(msg));
    }

    LogDebug("slack", "ReadThread " + channel + "/" + thread_ts + ": " +
                          std::to_string(messages.size()) + " messages from " +
                          std::to_string(pages) + " page(s), " +
                          std::to_string(filtered) + " status markers dropped");
    return R::Ok(std::move(messages));
}

// ---------------------------------------------------------------------------
// PostMessage
// ---------------------------------------------------------------------------
Result<PostedMessage, Error> PostMessage(ISlackSession& session,
                                         const std::string& token,
                                         const std::string& channel,
                                         const std::string& text) {
    using R = Result<PostedMessage, Error>;

    const nlohmann::json payload = {{"channel", channel}, {"text", text}};
    auto parsed = ParseApiResponse(
        "PostMessage", kPostMessagePath,
        session.Post(kPostMessagePath, payload.dump(),
                     "application/json; charset=utf-8", AuthHeaders(token)));
    if (parsed.IsErr()) return R::Err(std::move(parsed).Error());

    const auto& body = parsed.Value();
    PostedMessage posted;
    posted.channel = StringField(body, "channel", channel);
    posted.ts = StringField(body, "ts");
    LogInfo("slack", "Posted message to " + posted.channel);
    return R::Ok(std::move(posted));
}

} // namespace sqlite_mcp
