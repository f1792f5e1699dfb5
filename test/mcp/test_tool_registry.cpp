#include <catch2/catch_test_macros.hpp>

#include <sqlite_mcp/mcp/tool_registry.hpp>

#include <stdexcept>
#include <string>

using namespace sqlite_mcp;

namespace {

ToolInputSchema QuerySchema() {
    return {{"query", ParamType::String, "SQL text", true}};
}

ToolResult Echo(const nlohmann::json& args) {
    return MakeTextResult("ran: " + args.at("query").get<std::string>());
}

} // anonymous namespace

TEST_CASE("ToolRegistry: register and list tools", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("read_query", "Run a SELECT", QuerySchema(), Echo);
    registry.Register("list_tables", "List tables", {}, [](const nlohmann::json&) {
        return MakeTextResult("[]");
    });

    REQUIRE(registry.Tools().size() == 2);
    CHECK(registry.Tools()[0].name == "read_query");
    CHECK(registry.Tools()[0].description == "Run a SELECT");
    CHECK(registry.Tools()[1].name == "list_tables");
    CHECK(registry.HasTool("list_tables"));
    CHECK_FALSE(registry.HasTool("drop_everything"));
    CHECK(registry.Find("read_query") != nullptr);
    CHECK(registry.Find("drop_everything") == nullptr);
}

TEST_CASE("ToolRegistry: Register rejects malformed registrations", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("read_query", "Run a SELECT", QuerySchema(), Echo);

    CHECK_THROWS_AS(registry.Register("", "x", {}, Echo), std::invalid_argument);
    CHECK_THROWS_AS(registry.Register("read_query", "again", {}, Echo),
                    std::invalid_argument);
    CHECK_THROWS_AS(registry.Register("no_handler", "x", {}, ToolHandler{}),
                    std::invalid_argument);
    CHECK_THROWS_AS(registry.Register("dup_param", "x",
                                      {{"a", ParamType::String, "", true},
                                       {"a", ParamType::String, "", true}},
                                      Echo),
                    std::invalid_argument);

    CHECK(registry.Tools().size() == 1);
}

TEST_CASE("ToolRegistry: execute registered tool", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("read_query", "Run a SELECT", QuerySchema(), Echo);

    auto result = registry.Execute("read_query", {{"query", "SELECT 1"}});
    CHECK_FALSE(result.is_error);
    REQUIRE(result.content.size() == 1);
    CHECK(result.content[0]["type"] == "text");
    CHECK(result.content[0]["text"] == "ran: SELECT 1");
}

TEST_CASE("ToolRegistry: execute unknown tool returns error", "[mcp][registry]") {
    ToolRegistry registry;

    auto result = registry.Execute("nonexistent", nlohmann::json::object());
    CHECK(result.is_error);
    CHECK(result.content[0]["text"] == "Unknown tool: nonexistent");
}

TEST_CASE("ToolRegistry: bad arguments never reach the handler", "[mcp][registry]") {
    ToolRegistry registry;
    int calls = 0;
    registry.Register("read_query", "Run a SELECT", QuerySchema(),
                      [&calls](const nlohmann::json& args) {
                          ++calls;
                          return Echo(args);
                      });

    auto missing = registry.Execute("read_query", nlohmann::json::object());
    CHECK(missing.is_error);
    CHECK(missing.content[0]["text"] == "Missing required parameter: query");

    auto wrong = registry.Execute("read_query", {{"query", 42}});
    CHECK(wrong.is_error);

    CHECK(calls == 0);
}

TEST_CASE("ToolRegistry: handler exceptions propagate", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("write_query", "Write", QuerySchema(),
                      [](const nlohmann::json&) -> ToolResult {
                          throw ToolExecutionError(Error{
                              "WriteQuery", "", std::nullopt,
                              "UNIQUE constraint failed: carriers.name",
                              std::nullopt, ErrorCategory::Statement});
                      });

    try {
        (void)registry.Execute("write_query", {{"query", "INSERT"}});
        FAIL("expected ToolExecutionError");
    } catch (const ToolExecutionError& e) {
        CHECK(std::string(e.what()) == "UNIQUE constraint failed: carriers.name");
        CHECK(e.error().category == ErrorCategory::Statement);
    }
}

TEST_CASE("MakeTextResult: single text block", "[mcp][registry]") {
    auto ok = MakeTextResult("hello");
    CHECK_FALSE(ok.is_error);
    CHECK(ok.content == nlohmann::json::array({{{"type", "text"}, {"text", "hello"}}}));

    auto err = MakeTextResult("bad", true);
    CHECK(err.is_error);
}
