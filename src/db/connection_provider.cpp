#include <sqlite_mcp/db/connection_provider.hpp>

#include <sqlite_mcp/core/log.hpp>

#include <sqlite3.h>

#include <thread>

namespace sqlite_mcp {

namespace {

constexpr const char* kLivenessSql = "SELECT 1 FROM sqlite_master LIMIT 1";

Error MakeConnectionError(const std::string& path, const std::string& message) {
    return Error{"Connect", path, std::nullopt, message, std::nullopt,
                 ErrorCategory::Connection};
}

} // anonymous namespace

ConnectionProvider::ConnectionProvider(ConnectionOptions options, SleepFn sleep)
    : options_(std::move(options)), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

Result<Connection, Error> ConnectionProvider::Acquire() const {
    const int attempts = options_.max_attempts < 1 ? 1 : options_.max_attempts;
    std::string last_cause;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto result = TryOpen();
        if (result.IsOk()) {
            if (attempt > 1) {
                LogInfo("db", "Connected to " + options_.path + " on attempt " +
                                  std::to_string(attempt));
            }
            return result;
        }

        last_cause = result.Error().message;
        LogWarn("db", "Connection attempt " + std::to_string(attempt) + "/" +
                          std::to_string(attempts) + " failed: " + last_cause);

        if (attempt < attempts) {
            sleep_(options_.retry_delay * attempt);
        }
    }

    return Result<Connection, Error>::Err(MakeConnectionError(
        options_.path, "Failed to connect after " + std::to_string(attempts) +
                           " attempts: " + last_cause));
}

Result<Connection, Error> ConnectionProvider::TryOpen() const {
    int flags = SQLITE_OPEN_READWRITE;
    if (options_.create_if_missing) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(options_.path.c_str(), &raw, flags, nullptr);
    // The handle is owned even when open fails; it must still be closed.
    Connection conn(raw);
    if (rc != SQLITE_OK) {
        const std::string message = raw != nullptr ? conn.LastErrorMessage()
                                                   : std::string(sqlite3_errstr(rc));
        return Result<Connection, Error>::Err(
            MakeConnectionError(options_.path, message));
    }

    if (sqlite3_busy_timeout(conn.Handle(),
                             static_cast<int>(options_.busy_timeout.count())) != SQLITE_OK) {
        return Result<Connection, Error>::Err(
            MakeConnectionError(options_.path, conn.LastErrorMessage()));
    }

    // Touching the schema makes SQLite read the file header, so a file
    // that is not a database fails here rather than on the first query.
    auto check = conn.Execute(kLivenessSql, "Connect");
    if (check.IsErr()) {
        return Result<Connection, Error>::Err(
            MakeConnectionError(options_.path, check.Error().message));
    }

    LogDebug("db", "Opened " + options_.path);
    return Result<Connection, Error>::Ok(std::move(conn));
}

} // namespace sqlite_mcp
