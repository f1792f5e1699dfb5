#include <sqlite_mcp/db/connection.hpp>

#include <sqlite3.h>

namespace sqlite_mcp {

void Connection::Closer::operator()(sqlite3* db) const noexcept {
    // sqlite3_close_v2 defers the close until outstanding statements are
    // finalized, so a leaked statement cannot keep the handle open forever.
    sqlite3_close_v2(db);
}

Connection::Connection(sqlite3* handle) noexcept : db_(handle) {}

Connection::~Connection() = default;

Result<void, Error> Connection::Execute(std::string_view sql,
                                        const std::string& operation) {
    char* errmsg = nullptr;
    const std::string statement(sql);
    const int rc = sqlite3_exec(db_.get(), statement.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return Result<void, Error>::Err(Error{
            operation, "", std::nullopt, message, std::nullopt,
            ErrorCategory::Statement});
    }
    return Result<void, Error>::Ok();
}

std::string Connection::LastErrorMessage() const {
    if (!db_) return "no database handle";
    return sqlite3_errmsg(db_.get());
}

} // namespace sqlite_mcp
