#include <kiosk_provision/core/log.hpp>
#include <kiosk_provision/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kiosk_provision {

namespace {

struct LevelStyle {
    const char* name;
    const char* padded; // fixed five columns for the colored layout
    const char* color;
};

LevelStyle StyleOf(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return {"DEBUG", "DEBUG", ansi::kDim};
        case LogLevel::Info:  return {"INFO", "INFO ", ansi::kCyan};
        case LogLevel::Warn:  return {"WARN", "WARN ", ansi::kYellow};
        case LogLevel::Error: return {"ERROR", "ERROR", ansi::kRed};
    }
    return {"UNKNOWN", "?????", ansi::kReset};
}

// UTC with milliseconds for files and JSON, local wall-clock time for the
// colored console layout.
std::string Timestamp(bool utc_with_millis) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
#ifdef _WIN32
    if (utc_with_millis) gmtime_s(&parts, &seconds); else localtime_s(&parts, &seconds);
#else
    if (utc_with_millis) gmtime_r(&seconds, &parts); else localtime_r(&seconds, &parts);
#endif

    std::ostringstream oss;
    if (!utc_with_millis) {
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

void WriteRecordLine(std::ostream& out, LogLevel level,
                     std::string_view component, std::string_view message) {
    out << Timestamp(true) << " [" << StyleOf(level).name << "] [" << component
        << "] " << message << '\n';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WriteRecordLine(out_, level, component, message);
        return;
    }

    const auto style = StyleOf(level);
    const bool loud = level >= LogLevel::Warn;
    out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
         << style.color << style.padded << ansi::kReset << ' '
         << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (loud) {
        out_ << style.color << message << ansi::kReset << '\n';
    } else {
        out_ << message << '\n';
    }
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::ordered_json record;
    record["ts"] = Timestamp(true);
    record["level"] = StyleOf(level).name;
    record["component"] = std::string(component);
    record["message"] = std::string(message);
    // Tool output is not guaranteed to be UTF-8.
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    WriteRecordLine(file_, level, component, message);
    file_.flush();
}

// ---------------------------------------------------------------------------
// LevelFilterSink / TeeSink
// ---------------------------------------------------------------------------
LevelFilterSink::LevelFilterSink(std::unique_ptr<ILogSink> inner, LogLevel min_level)
    : inner_(std::move(inner)), min_level_(min_level) {}

void LevelFilterSink::Write(LogLevel level, std::string_view component,
                            std::string_view message) {
    if (level >= min_level_) {
        inner_->Write(level, component, message);
    }
}

TeeSink::TeeSink(std::vector<std::unique_ptr<ILogSink>> sinks)
    : sinks_(std::move(sinks)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    for (auto& sink : sinks_) {
        sink->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
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
    if (level >= min_level_) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
namespace {

class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto slot = std::make_unique<Logger>(std::make_unique<DiscardSink>(),
                                                LogLevel::Error);
    return slot;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalSlot();
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

} // namespace kiosk_provision
