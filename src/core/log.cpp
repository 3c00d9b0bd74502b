#include <mcp_rails/core/log.hpp>
#include <mcp_rails/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace mcp_rails {

namespace {

struct LevelStyle {
    const char* name;   // JSON and plain console
    const char* tag;    // colored console, fixed width
    const char* color;
};

const LevelStyle& StyleOf(LogLevel level) {
    static const LevelStyle kDebug{"DEBUG", "DEBUG", ansi::kDim};
    static const LevelStyle kInfo{"INFO", "INFO ", ansi::kCyan};
    static const LevelStyle kWarn{"WARN", "WARN ", ansi::kYellow};
    static const LevelStyle kError{"ERROR", "ERROR", ansi::kRed};
    switch (level) {
        case LogLevel::Debug: return kDebug;
        case LogLevel::Info:  return kInfo;
        case LogLevel::Warn:  return kWarn;
        case LogLevel::Error: break;
    }
    return kError;
}

// UTC "2024-01-31T12:00:00.123Z", or local "12:00:00" when short_form.
std::string Timestamp(bool short_form) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
    std::ostringstream oss;
    if (short_form) {
        localtime_r(&seconds, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    gmtime_r(&seconds, &parts);
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto logger = std::make_unique<Logger>(std::make_unique<NullSink>(),
                                                  LogLevel::Error);
    return logger;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    const auto& style = StyleOf(level);
    if (use_color_) {
        out_ << ansi::kDim << Timestamp(true) << ansi::kReset << ' '
             << style.color << style.tag << ansi::kReset << ' '
             << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
        if (level == LogLevel::Error) {
            out_ << style.color << message << ansi::kReset;
        } else {
            out_ << message;
        }
    } else {
        out_ << Timestamp(false) << " [" << style.name << "] [" << component
             << "] " << message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const nlohmann::json line = {
        {"ts", Timestamp(false)},
        {"level", StyleOf(level).name},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Messages can quote client input, which is not guaranteed to be UTF-8.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

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
    if (level < min_level_) {
        return;
    }
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() { return *GlobalSlot(); }

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

} // namespace mcp_rails
