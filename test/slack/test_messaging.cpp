#include <catch2/catch_test_macros.hpp>

#include <sqlite_mcp/slack/credentials.hpp>
#include <sqlite_mcp/slack/messaging.hpp>

#include "../../test/mocks/mock_slack_session.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

using namespace sqlite_mcp;
using namespace sqlite_mcp::testing;

namespace {

void SetEnv(const char* name, const char* value) {
    setenv(name, value, 1);
}

void UnsetEnv(const char* name) {
    unsetenv(name);
}

// Thread reply as the platform returns it.
nlohmann::json Reply(const std::string& text, bool bot = false,
                     const std::string& ts = "1712345678.000100") {
    nlohmann::json m = {{"type", "message"}, {"text", text}, {"ts", ts}};
    if (bot) m["bot_id"] = "B0123";
    return m;
}

std::string Replies(const nlohmann::json& messages) {
    return nlohmann::json{{"ok", true}, {"messages", messages}}.dump();
}

std::string QueryValue(const std::string& path, const std::string& key) {
    const auto needle = key + "=";
    auto pos = path.find("?" + needle);
    if (pos == std::string::npos) pos = path.find("&" + needle);
    if (pos == std::string::npos) return "";
    pos += needle.size() + 1;
    return path.substr(pos, path.find('&', pos) - pos);
}

// Serves a thread the way conversations.replies does: oldest first, the
// parent message leading, at most `limit` entries per page, and an offset
// cursor in response_metadata while more remain.
class ThreadReplies : public ISlackSession {
public:
    explicit ThreadReplies(int replies) {
        thread_.push_back(Reply("parent", false, "100.000000"));
        for (int i = 1; i <= replies; ++i) {
            thread_.push_back(Reply("R" + std::to_string(i), i % 2 == 0,
                                    "100.00000" + std::to_string(i)));
        }
    }

    Result<HttpResponse, Error> Get(std::string_view path,
                                    const HttpHeaders& /*headers*/) override {
        paths.emplace_back(path);
        const std::size_t page = std::stoul(QueryValue(paths.back(), "limit"));
        const auto cursor = QueryValue(paths.back(), "cursor");
        const std::size_t offset = cursor.empty() ? 0 : std::stoul(cursor.substr(4));

        nlohmann::json messages = nlohmann::json::array();
        for (std::size_t i = offset; i < thread_.size() && i < offset + page; ++i) {
            messages.push_back(thread_[i]);
        }
        nlohmann::json body = {{"ok", true}, {"messages", messages}};
        if (offset + page < thread_.size()) {
            body["has_more"] = true;
            body["response_metadata"] = {
                {"next_cursor", "off_" + std::to_string(offset + page)}};
        }
        return Result<HttpResponse, Error>::Ok(HttpResponse{200, {}, body.dump()});
    }

    Result<HttpResponse, Error> Post(std::string_view, std::string_view,
                                     std::string_view, const HttpHeaders&) override {
        return Result<HttpResponse, Error>::Err(Error{
            "Post", "", std::nullopt, "not expected", std::nullopt});
    }

    std::vector<std::string> paths;

private:
    std::vector<nlohmann::json> thread_;
};

} // anonymous namespace

// ===========================================================================
// IsStatusMarker
// ===========================================================================

TEST_CASE("IsStatusMarker: glyphs and shortcodes at the start", "[slack][messaging]") {
    CHECK(IsStatusMarker("\xE2\x8F\xB3 Looking up deposits..."));      // hourglass flowing sand
    CHECK(IsStatusMarker("\xE2\x8C\x9B done soon"));                    // hourglass
    CHECK(IsStatusMarker("\xF0\x9F\x94\x84 Retrying"));                 // arrows
    CHECK(IsStatusMarker("\xF0\x9F\x94\x8D Searching"));                // magnifier
    CHECK(IsStatusMarker("\xE2\x9A\x99\xEF\xB8\x8F Running query"));    // gear + VS16
    CHECK(IsStatusMarker("\xF0\x9F\xA4\x94 Thinking"));                 // thinking face
    CHECK(IsStatusMarker("\xF0\x9F\x92\xAD hmm"));                      // thought balloon
    CHECK(IsStatusMarker(":hourglass_flowing_sand: Working"));
    CHECK(IsStatusMarker(":mag: Searching"));
    CHECK(IsStatusMarker("  \n:thinking_face:"));
}

TEST_CASE("IsStatusMarker: ordinary text and markers later in the text", "[slack][messaging]") {
    CHECK_FALSE(IsStatusMarker("Store 12 is near its insurance limit"));
    CHECK_FALSE(IsStatusMarker("Done \xE2\x8F\xB3"));
    CHECK_FALSE(IsStatusMarker(""));
    CHECK_FALSE(IsStatusMarker("   "));
    CHECK_FALSE(IsStatusMarker(":white_check_mark: approved"));
}

// ===========================================================================
// ReadThread
// ===========================================================================

TEST_CASE("ReadThread: sends channel, ts, limit and bearer token", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::Json(Replies(nlohmann::json::array())));

    auto result = ReadThread(mock, "xoxb-test", "C01ABC", "1712345678.000100", 10);
    REQUIRE(result.IsOk());

    REQUIRE(mock.GetCallCount() == 1);
    const auto& call = mock.GetCalls()[0];
    CHECK(call.path ==
          "/api/conversations.replies?channel=C01ABC&ts=1712345678.000100&limit=1000");
    CHECK(call.headers.at("Authorization") == "Bearer xoxb-test");
}

TEST_CASE("ReadThread: classifies roles and drops status chatter", "[slack][messaging]") {
    MockSlackSession mock;
    nlohmann::json messages = nlohmann::json::array({
        Reply("Which stores are over-serviced?"),
        Reply("\xE2\x8F\xB3 Analyzing deposit patterns...", true),
        Reply("Stores 3 and 7 get daily pickups for low volume.", true),
        Reply("Thanks"),
    });
    nlohmann::json subtype_bot = Reply("Legacy integration post");
    subtype_bot["subtype"] = "bot_message";
    messages.push_back(subtype_bot);
    mock.EnqueueGet(MockSlackSession::Json(Replies(messages)));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsOk());
    const auto& thread = result.Value();
    REQUIRE(thread.size() == 4);

    CHECK(thread[0].role == MessageRole::User);
    CHECK(thread[0].text == "Which stores are over-serviced?");
    CHECK(thread[1].role == MessageRole::Assistant);
    CHECK(thread[1].text == "Stores 3 and 7 get daily pickups for low volume.");
    CHECK(thread[2].role == MessageRole::User);
    CHECK(thread[3].role == MessageRole::Assistant);
}

TEST_CASE("ReadThread: keeps only the most recent messages in order", "[slack][messaging]") {
    MockSlackSession mock;
    nlohmann::json messages = nlohmann::json::array();
    for (int i = 1; i <= 6; ++i) {
        messages.push_back(Reply("m" + std::to_string(i)));
    }
    mock.EnqueueGet(MockSlackSession::Json(Replies(messages)));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 3);
    REQUIRE(result.IsOk());
    const auto& thread = result.Value();
    REQUIRE(thread.size() == 3);
    CHECK(thread[0].text == "m4");
    CHECK(thread[1].text == "m5");
    CHECK(thread[2].text == "m6");
}

TEST_CASE("ReadThread: long thread yields its newest replies, not the parent", "[slack][messaging]") {
    ThreadReplies slack(20);

    auto result = ReadThread(slack, "xoxb", "C01", "100.000000", 3);
    REQUIRE(result.IsOk());
    const auto& thread = result.Value();
    REQUIRE(thread.size() == 3);
    CHECK(thread[0].text == "R18");
    CHECK(thread[0].role == MessageRole::Assistant);
    CHECK(thread[1].text == "R19");
    CHECK(thread[1].role == MessageRole::User);
    CHECK(thread[2].text == "R20");

    // The caller's limit is applied locally, never as the page size.
    REQUIRE(slack.paths.size() == 1);
    CHECK(QueryValue(slack.paths[0], "limit") == "1000");
}

TEST_CASE("ReadThread: follows the page cursor to the end of the thread", "[slack][messaging]") {
    ThreadReplies slack(2500);

    auto result = ReadThread(slack, "xoxb", "C01", "100.000000", 2);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 2);
    CHECK(result.Value()[0].text == "R2499");
    CHECK(result.Value()[1].text == "R2500");

    REQUIRE(slack.paths.size() == 3);
    CHECK(QueryValue(slack.paths[0], "cursor").empty());
    CHECK(QueryValue(slack.paths[1], "cursor") == "off_1000");
    CHECK(QueryValue(slack.paths[2], "cursor") == "off_2000");
}

TEST_CASE("ReadThread: short thread is returned whole with its parent", "[slack][messaging]") {
    ThreadReplies slack(4);

    auto result = ReadThread(slack, "xoxb", "C01", "100.000000", 10);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 5);
    CHECK(result.Value()[0].text == "parent");
    CHECK(result.Value()[4].text == "R4");
}

TEST_CASE("ReadThread: error on a later page fails the read", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::Json(
        R"({"ok":true,"messages":[{"text":"a","ts":"1.0"}],)"
        R"("response_metadata":{"next_cursor":"bmV4dA=="}})"));
    mock.EnqueueGet(MockSlackSession::Json(R"({"ok":false,"error":"ratelimited"})"));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "ratelimited");
    REQUIRE(mock.GetCallCount() == 2);
    // Cursors are opaque and percent-encoded on the way out.
    CHECK(mock.GetCalls()[1].path.find("&cursor=bmV4dA%3D%3D") != std::string::npos);
}

TEST_CASE("ReadThread: a cursor that repeats is an upstream error", "[slack][messaging]") {
    MockSlackSession mock;
    const std::string page =
        R"({"ok":true,"messages":[{"text":"a","ts":"1.0"}],)"
        R"("response_metadata":{"next_cursor":"same"}})";
    mock.EnqueueGet(MockSlackSession::Json(page));
    mock.EnqueueGet(MockSlackSession::Json(page));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Upstream);
    CHECK(mock.GetCallCount() == 2);
}

TEST_CASE("ReadThread: null bot_id is a user message", "[slack][messaging]") {
    MockSlackSession mock;
    auto m = Reply("hello");
    m["bot_id"] = nullptr;
    mock.EnqueueGet(MockSlackSession::Json(Replies(nlohmann::json::array({m}))));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 1);
    CHECK(result.Value()[0].role == MessageRole::User);
}

TEST_CASE("ReadThread: platform error code is surfaced verbatim", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::Json(R"({"ok":false,"error":"thread_not_found"})"));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "thread_not_found");
    CHECK(result.Error().platform_error == "thread_not_found");
    CHECK(result.Error().category == ErrorCategory::Upstream);
}

TEST_CASE("ReadThread: auth error codes are Authentication", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::Json(R"({"ok":false,"error":"invalid_auth"})"));

    auto result = ReadThread(mock, "bad", "C01", "1.0", 10);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "invalid_auth");
    CHECK(result.Error().category == ErrorCategory::Authentication);
}

TEST_CASE("ReadThread: transport failure carries the cause", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::TransportError("Could not establish connection"));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "Slack API request failed: Could not establish connection");
    CHECK(result.Error().operation == "ReadThread");
}

TEST_CASE("ReadThread: non-2xx status is reported with the code", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::Json("upstream down", 503));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.rfind("HTTP 503", 0) == 0);
    CHECK(result.Error().http_status == 503);
}

TEST_CASE("ReadThread: unparseable body is an error", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::Json("<html>gateway</html>"));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.rfind("Invalid response from Slack API", 0) == 0);
}

TEST_CASE("ReadThread: missing messages array is an empty thread", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueueGet(MockSlackSession::Json(R"({"ok":true})"));

    auto result = ReadThread(mock, "xoxb", "C01", "1.0", 10);
    REQUIRE(result.IsOk());
    CHECK(result.Value().empty());
}

// ===========================================================================
// PostMessage
// ===========================================================================

TEST_CASE("PostMessage: posts JSON with bearer token", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueuePost(MockSlackSession::Json(
        R"({"ok":true,"channel":"C01ABC","ts":"1712345999.000200"})"));

    auto result = PostMessage(mock, "xoxb-test", "C01ABC", "Store 12 is at 95% of its limit");
    REQUIRE(result.IsOk());
    CHECK(result.Value().channel == "C01ABC");
    CHECK(result.Value().ts == "1712345999.000200");

    REQUIRE(mock.PostCallCount() == 1);
    const auto& call = mock.PostCalls()[0];
    CHECK(call.path == "/api/chat.postMessage");
    CHECK(call.content_type == "application/json; charset=utf-8");
    CHECK(call.headers.at("Authorization") == "Bearer xoxb-test");

    auto body = nlohmann::json::parse(call.body);
    CHECK(body["channel"] == "C01ABC");
    CHECK(body["text"] == "Store 12 is at 95% of its limit");
}

TEST_CASE("PostMessage: not_in_channel is surfaced verbatim", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueuePost(MockSlackSession::Json(R"({"ok":false,"error":"not_in_channel"})"));

    auto result = PostMessage(mock, "xoxb", "C99", "hi");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "not_in_channel");
}

TEST_CASE("PostMessage: ok without error field", "[slack][messaging]") {
    MockSlackSession mock;
    mock.EnqueuePost(MockSlackSession::Json(R"({"ok":false})"));

    auto result = PostMessage(mock, "xoxb", "C99", "hi");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "unknown_error");
}

// ===========================================================================
// EnvCredential
// ===========================================================================

TEST_CASE("EnvCredential: reads the variable on every call", "[slack][credentials]") {
    const char* kVar = "SQLITE_MCP_TEST_TOKEN";
    UnsetEnv(kVar);
    auto source = EnvCredential(kVar);

    CHECK_FALSE(source().has_value());

    SetEnv(kVar, "xoxb-first");
    CHECK(source() == "xoxb-first");

    // Rotation is picked up without rebuilding the source.
    SetEnv(kVar, "xoxb-second");
    CHECK(source() == "xoxb-second");

    SetEnv(kVar, "");
    CHECK_FALSE(source().has_value());
    UnsetEnv(kVar);
}
