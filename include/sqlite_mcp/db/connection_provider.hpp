#pragma once

#include <sqlite_mcp/core/result.hpp>
#include <sqlite_mcp/db/connection.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace sqlite_mcp {

// ---------------------------------------------------------------------------
// ConnectionOptions: how the provider opens the store.
// ---------------------------------------------------------------------------
struct ConnectionOptions {
    std::string path;
    int max_attempts = 3;
    std::chrono::milliseconds retry_delay{500};
    // Per-attempt wait on a locked database (SQLite busy timeout).
    std::chrono::milliseconds busy_timeout{10000};
    bool create_if_missing = false;
};

// Blocks the caller for the given duration between attempts.
using SleepFn = std::function<void(std::chrono::milliseconds)>;

// ---------------------------------------------------------------------------
// ConnectionProvider: opens a fresh, checked connection per call.
//
// Each attempt opens the file, applies the busy timeout and runs a
// one-row liveness query against sqlite_master. A failed attempt k is followed by
// a sleep of retry_delay * k before attempt k+1 (linear backoff); no
// sleep follows the final attempt. Connections are never pooled or reused.
//
// The sleep is a plain blocking wait: the server is single-threaded and
// handles one request at a time.
// ---------------------------------------------------------------------------
class ConnectionProvider {
public:
    explicit ConnectionProvider(ConnectionOptions options, SleepFn sleep = {});

    [[nodiscard]] Result<Connection, Error> Acquire() const;

    [[nodiscard]] const ConnectionOptions& Options() const noexcept {
        return options_;
    }

private:
    [[nodiscard]] Result<Connection, Error> TryOpen() const;

    ConnectionOptions options_;
    SleepFn sleep_;
};

} // namespace sqlite_mcp
