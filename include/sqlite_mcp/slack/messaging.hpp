#pragma once

#include <sqlite_mcp/core/result.hpp>
#include <sqlite_mcp/slack/i_slack_session.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sqlite_mcp {

// Largest thread window ReadThread returns. Also the page size it asks
// conversations.replies for, which is the platform's own maximum.
constexpr int kMaxThreadLimit = 1000;

enum class MessageRole {
    User,
    Assistant,
};

[[nodiscard]] const char* RoleName(MessageRole role);

struct ThreadMessage {
    MessageRole role = MessageRole::User;
    std::string text;
    std::string ts;
};

struct PostedMessage {
    std::string channel;
    std::string ts;
};

/// True if `text` (after leading whitespace) starts with one of the
/// progress glyphs or shortcodes the bot posts while it is working.
[[nodiscard]] bool IsStatusMarker(std::string_view text);

// ---------------------------------------------------------------------------
// ReadThread: up to `limit` most recent messages of a thread, oldest
// first, with bot progress chatter removed. Messages carrying a bot_id or
// subtype "bot_message" are Assistant, everything else User.
//
// The platform pages a thread oldest first, so every page is fetched
// (following response_metadata.next_cursor) and only the newest `limit`
// messages are kept while paging.
//
// Endpoint: GET /api/conversations.replies
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<ThreadMessage>, Error> ReadThread(
    ISlackSession& session,
    const std::string& token,
    const std::string& channel,
    const std::string& thread_ts,
    int limit);

// ---------------------------------------------------------------------------
// PostMessage: post `text` to `channel`.
//
// Endpoint: POST /api/chat.postMessage
// Callers are expected to have obtained human approval beforehand; this
// function does not check.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<PostedMessage, Error> PostMessage(
    ISlackSession& session,
    const std::string& token,
    const std::string& channel,
    const std::string& text);

} // namespace sqlite_mcp
