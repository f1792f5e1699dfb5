#include <sqlite_mcp/core/log.hpp>
#include <sqlite_mcp/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sqlite_mcp {

namespace {

struct LevelStyle {
    const char* name;   // plain and JSON formats
    const char* tag;    // fixed width, colored format
    const char* color;
};

constexpr std::array<LevelStyle, 4> kLevelStyles = {{
    {"DEBUG", "DEBUG", ansi::kDim},
    {"INFO",  "INFO ", ansi::kCyan},
    {"WARN",  "WARN ", ansi::kYellow},
    {"ERROR", "ERROR", ansi::kRed},
}};

const LevelStyle& StyleOf(LogLevel level) {
    return kLevelStyles[static_cast<std::size_t>(level)];
}

enum class Clock { Utc, Local };

// `with_millis` appends ".mmmZ" (UTC only).
std::string Timestamp(Clock clock, const char* format, bool with_millis) {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);

    std::tm tm{};
#ifdef _WIN32
    if (clock == Clock::Utc) gmtime_s(&tm, &secs); else localtime_s(&tm, &secs);
#else
    if (clock == Clock::Utc) gmtime_r(&secs, &tm); else localtime_r(&secs, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    if (with_millis) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    }
    return oss.str();
}

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message) {
    out << Timestamp(Clock::Utc, "%Y-%m-%dT%H:%M:%S", true)
        << " [" << StyleOf(level).name << "] [" << component << "] "
        << message << '\n';
}

void WriteJsonLine(std::ostream& out, LogLevel level,
                   std::string_view component, std::string_view message) {
    const nlohmann::json record = {
        {"ts", Timestamp(Clock::Utc, "%Y-%m-%dT%H:%M:%S", true)},
        {"level", StyleOf(level).name},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    out << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        << '\n';
}

} // anonymous namespace

bool ParseLogLevel(std::string_view name, LogLevel& out) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") upper = "WARN";
    for (std::size_t i = 0; i < kLevelStyles.size(); ++i) {
        if (upper == kLevelStyles[i].name) {
            out = static_cast<LogLevel>(i);
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WritePlainLine(out_, level, component, message);
}

ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message);
        return;
    }

    const auto& style = StyleOf(level);
    out_ << ansi::kDim << Timestamp(Clock::Local, "%H:%M:%S", false) << ansi::kReset
         << ' ' << style.color << style.tag << ansi::kReset
         << ' ' << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    // Errors are the lines an operator scans for.
    if (level == LogLevel::Error) {
        out_ << style.color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    WriteJsonLine(out_, level, component, message);
}

FileSink::FileSink(const std::string& path, bool json)
    : file_(path, std::ios::app), json_(json) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    if (json_) {
        WriteJsonLine(file_, level, component, message);
    } else {
        WritePlainLine(file_, level, component, message);
    }
    file_.flush();
}

TeeSink::TeeSink(std::unique_ptr<ILogSink> first,
                 std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    if (first_) first_->Write(level, component, message);
    if (second_) second_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Reset(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
    min_level_ = min_level;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_ && level >= min_level_;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_ && level >= min_level_) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
Logger& GlobalLogger() {
    // No sink until InitGlobalLogger: records are dropped.
    static Logger instance(nullptr, LogLevel::Error);
    return instance;
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLogger().Reset(std::move(sink), min_level);
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace sqlite_mcp
