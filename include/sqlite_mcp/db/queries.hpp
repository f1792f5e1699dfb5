#pragma once

#include <sqlite_mcp/core/result.hpp>
#include <sqlite_mcp/db/connection.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqlite_mcp {

// ---------------------------------------------------------------------------
// Store-level value and result types.
// ---------------------------------------------------------------------------
using Blob = std::vector<std::uint8_t>;

// One cell as SQLite stores it: NULL, INTEGER, REAL, TEXT or BLOB.
using Value = std::variant<std::nullptr_t, std::int64_t, double, std::string, Blob>;

struct ColumnInfo {
    std::string name;
    std::string type;      // declared type, may be empty
    bool not_null = false;
    int pk = 0;            // 1-based position in the primary key, 0 if not part of it
};

// Columns in projection order, rows in store iteration order. Always the
// full result set; presentation limits are applied by the caller.
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<Value>> rows;
};

struct WriteResult {
    std::int64_t affected_rows = 0;
};

// ---------------------------------------------------------------------------
// Operations. Each runs on a connection the caller owns. Store errors are
// returned with the SQLite message unmodified in Error::message.
// ---------------------------------------------------------------------------

/// Names of all tables in ascending lexical order.
[[nodiscard]] Result<std::vector<std::string>, Error> ListTables(Connection& conn);

/// Column metadata in the table's declared order. An unknown table yields
/// an empty list.
[[nodiscard]] Result<std::vector<ColumnInfo>, Error> DescribeTable(
    Connection& conn, std::string_view table_name);

/// Execute one read-only statement and collect every row.
[[nodiscard]] Result<QueryResult, Error> ReadQuery(Connection& conn,
                                                   std::string_view sql);

/// Execute one statement inside a transaction and commit it. Any failure
/// rolls the transaction back before the error is returned.
[[nodiscard]] Result<WriteResult, Error> WriteQuery(Connection& conn,
                                                    std::string_view sql);

} // namespace sqlite_mcp
