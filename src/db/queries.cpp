#include <sqlite_mcp/db/queries.hpp>

#include <sqlite_mcp/core/log.hpp>

#include <sqlite3.h>

#include <memory>

namespace sqlite_mcp {

namespace {

constexpr const char* kMultipleStatements =
    "You can only execute one statement at a time.";
constexpr const char* kNotReadOnly =
    "read_query only accepts read-only statements";

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

Error StatementError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Statement};
}

// Compile the first statement in `sql`. Anything after it other than
// whitespace, comments or empty statements is rejected. A null
// StatementPtr means `sql` held no statement at all.
Result<StatementPtr, Error> PrepareSingle(Connection& conn,
                                          std::string_view sql,
                                          const std::string& operation) {
    if (sql.empty()) {
        return Result<StatementPtr, Error>::Ok(StatementPtr{});
    }

    const char* begin = sql.data();
    const char* end = sql.data() + sql.size();
    const char* tail = nullptr;
    sqlite3_stmt* raw = nullptr;

    const int rc = sqlite3_prepare_v2(conn.Handle(), begin,
                                      static_cast<int>(sql.size()), &raw, &tail);
    StatementPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return Result<StatementPtr, Error>::Err(
            StatementError(operation, conn.LastErrorMessage()));
    }

    while (tail != nullptr && tail < end) {
        sqlite3_stmt* extra_raw = nullptr;
        const char* next = nullptr;
        const int extra_rc = sqlite3_prepare_v2(
            conn.Handle(), tail, static_cast<int>(end - tail), &extra_raw, &next);
        StatementPtr extra(extra_raw);
        if (extra_rc != SQLITE_OK || extra) {
            return Result<StatementPtr, Error>::Err(
                StatementError(operation, kMultipleStatements));
        }
        if (next == nullptr || next == tail) break;
        tail = next;
    }

    return Result<StatementPtr, Error>::Ok(std::move(stmt));
}

Value ReadCell(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return Value(std::in_place_type<std::int64_t>,
                         static_cast<std::int64_t>(sqlite3_column_int64(stmt, index)));
        case SQLITE_FLOAT:
            return Value(std::in_place_type<double>, sqlite3_column_double(stmt, index));
        case SQLITE_TEXT: {
            const auto* text = sqlite3_column_text(stmt, index);
            const int size = sqlite3_column_bytes(stmt, index);
            if (text == nullptr) return Value(std::in_place_type<std::string>);
            return Value(std::in_place_type<std::string>,
                         reinterpret_cast<const char*>(text),
                         static_cast<std::size_t>(size));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const std::uint8_t*>(
                sqlite3_column_blob(stmt, index));
            const int size = sqlite3_column_bytes(stmt, index);
            if (data == nullptr) return Value(std::in_place_type<Blob>);
            return Value(std::in_place_type<Blob>, data, data + size);
        }
        default:
            return Value(nullptr);
    }
}

std::string ColumnText(sqlite3_stmt* stmt, int index) {
    const auto* text = sqlite3_column_text(stmt, index);
    return text != nullptr ? std::string(reinterpret_cast<const char*>(text))
                           : std::string();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ListTables
// ---------------------------------------------------------------------------
Result<std::vector<std::string>, Error> ListTables(Connection& conn) {
    using R = Result<std::vector<std::string>, Error>;

    auto prepared = PrepareSingle(
        conn, "SELECT name FROM sqlite_master WHERE type='table' ORDER BY name",
        "ListTables");
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();

    std::vector<std::string> tables;
    for (;;) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            return R::Err(StatementError("ListTables", conn.LastErrorMessage()));
        }
        tables.push_back(ColumnText(stmt.get(), 0));
    }
    return R::Ok(std::move(tables));
}

// ---------------------------------------------------------------------------
// DescribeTable
// ---------------------------------------------------------------------------
Result<std::vector<ColumnInfo>, Error> DescribeTable(Connection& conn,
                                                     std::string_view table_name) {
    using R = Result<std::vector<ColumnInfo>, Error>;

    // Table-valued pragma so the name is bound, not spliced into SQL.
    auto prepared = PrepareSingle(
        conn,
        "SELECT name, type, \"notnull\", pk FROM pragma_table_info(?1) ORDER BY cid",
        "DescribeTable");
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();

    if (sqlite3_bind_text(stmt.get(), 1, table_name.data(),
                          static_cast<int>(table_name.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        return R::Err(StatementError("DescribeTable", conn.LastErrorMessage()));
    }

    std::vector<ColumnInfo> columns;
    for (;;) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            return R::Err(StatementError("DescribeTable", conn.LastErrorMessage()));
        }
        ColumnInfo col;
        col.name = ColumnText(stmt.get(), 0);
        col.type = ColumnText(stmt.get(), 1);
        col.not_null = sqlite3_column_int(stmt.get(), 2) != 0;
        col.pk = sqlite3_column_int(stmt.get(), 3);
        columns.push_back(std::move(col));
    }
    return R::Ok(std::move(columns));
}

// ---------------------------------------------------------------------------
// ReadQuery
// ---------------------------------------------------------------------------
Result<QueryResult, Error> ReadQuery(Connection& conn, std::string_view sql) {
    using R = Result<QueryResult, Error>;

    auto prepared = PrepareSingle(conn, sql, "ReadQuery");
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();

    QueryResult result;
    if (!stmt) return R::Ok(std::move(result));

    if (sqlite3_stmt_readonly(stmt.get()) == 0) {
        return R::Err(StatementError("ReadQuery", kNotReadOnly));
    }

    const int column_count = sqlite3_column_count(stmt.get());
    result.columns.reserve(static_cast<std::size_t>(column_count));
    for (int i = 0; i < column_count; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        result.columns.emplace_back(name != nullptr ? name : "");
    }

    for (;;) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            return R::Err(StatementError("ReadQuery", conn.LastErrorMessage()));
        }
        std::vector<Value> row;
        row.reserve(static_cast<std::size_t>(column_count));
        for (int i = 0; i < column_count; ++i) {
            row.push_back(ReadCell(stmt.get(), i));
        }
        result.rows.push_back(std::move(row));
    }

    LogDebug("db", "ReadQuery returned " + std::to_string(result.rows.size()) + " rows");
    return R::Ok(std::move(result));
}

// ---------------------------------------------------------------------------
// WriteQuery
// ---------------------------------------------------------------------------
Result<WriteResult, Error> WriteQuery(Connection& conn, std::string_view sql) {
    using R = Result<WriteResult, Error>;

    auto begin = conn.Execute("BEGIN", "WriteQuery");
    if (begin.IsErr()) return R::Err(std::move(begin).Error());

    // The store's message must be captured before ROLLBACK replaces it.
    auto rollback = [&conn](const std::string& message) {
        auto rb = conn.Execute("ROLLBACK", "WriteQuery");
        if (rb.IsErr()) {
            LogWarn("db", "Rollback failed: " + rb.Error().message);
        }
        return R::Err(StatementError("WriteQuery", message));
    };

    auto prepared = PrepareSingle(conn, sql, "WriteQuery");
    if (prepared.IsErr()) return rollback(prepared.Error().message);
    auto stmt = std::move(prepared).Value();

    WriteResult result;
    if (stmt) {
        for (;;) {
            const int rc = sqlite3_step(stmt.get());
            if (rc == SQLITE_DONE) break;
            if (rc == SQLITE_ROW) continue;  // e.g. INSERT ... RETURNING
            const std::string message = conn.LastErrorMessage();
            stmt.reset();
            return rollback(message);
        }
        result.affected_rows = sqlite3_changes(conn.Handle());
        stmt.reset();
    }

    // A statement that ended the transaction itself leaves nothing to commit.
    if (sqlite3_get_autocommit(conn.Handle()) == 0) {
        auto commit = conn.Execute("COMMIT", "WriteQuery");
        if (commit.IsErr()) return rollback(commit.Error().message);
    }

    LogDebug("db", "WriteQuery affected " + std::to_string(result.affected_rows) + " rows");
    return R::Ok(result);
}

} // namespace sqlite_mcp
