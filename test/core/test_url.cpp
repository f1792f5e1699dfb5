#include <catch2/catch_test_macros.hpp>

#include <sqlite_mcp/core/url.hpp>

using namespace sqlite_mcp;

TEST_CASE("UrlEncode: unreserved chars passthrough", "[core][url]") {
    CHECK(UrlEncode("C01ABCDEF") == "C01ABCDEF");
    CHECK(UrlEncode("a-b_c.d~e") == "a-b_c.d~e");
    CHECK(UrlEncode("") == "");
}

TEST_CASE("UrlEncode: reserved and space encoded in upper-case hex", "[core][url]") {
    CHECK(UrlEncode("hello world") == "hello%20world");
    CHECK(UrlEncode("a=b&c") == "a%3Db%26c");
    CHECK(UrlEncode("/x") == "%2Fx");
}

TEST_CASE("UrlEncode: UTF-8 bytes are encoded individually", "[core][url]") {
    CHECK(UrlEncode("\xC3\xA9") == "%C3%A9");
}

TEST_CASE("WithQuery: appends encoded parameters in order", "[core][url]") {
    auto url = WithQuery("/api/conversations.replies",
                         {{"channel", "C01"}, {"ts", "1712345678.000100"}, {"limit", "10"}});
    CHECK(url == "/api/conversations.replies?channel=C01&ts=1712345678.000100&limit=10");
}

TEST_CASE("WithQuery: extends an existing query string", "[core][url]") {
    CHECK(WithQuery("/p?a=1", {{"b", "x y"}}) == "/p?a=1&b=x%20y");
}

TEST_CASE("WithQuery: no parameters leaves the path alone", "[core][url]") {
    CHECK(WithQuery("/api/chat.postMessage", {}) == "/api/chat.postMessage");
}
