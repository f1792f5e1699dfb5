#pragma once

#include <sqlite_mcp/core/result.hpp>

#include <memory>
#include <string>
#include <string_view>

struct sqlite3;

namespace sqlite_mcp {

// ---------------------------------------------------------------------------
// Connection: owning handle to one open SQLite database.
//
// Move-only. The handle is closed when the Connection goes out of scope,
// so a tool call that acquires one releases it on every return path.
// ---------------------------------------------------------------------------
class Connection {
public:
    explicit Connection(sqlite3* handle) noexcept;
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) noexcept = default;
    Connection& operator=(Connection&&) noexcept = default;

    [[nodiscard]] sqlite3* Handle() const noexcept { return db_.get(); }

    /// Run one or more statements that produce no rows (BEGIN, COMMIT,
    /// DDL scripts). `operation` labels the returned Error.
    [[nodiscard]] Result<void, Error> Execute(std::string_view sql,
                                              const std::string& operation = "Execute");

    /// The most recent error text reported by SQLite for this handle.
    [[nodiscard]] std::string LastErrorMessage() const;

private:
    struct Closer {
        void operator()(sqlite3* db) const noexcept;
    };

    std::unique_ptr<sqlite3, Closer> db_;
};

} // namespace sqlite_mcp
