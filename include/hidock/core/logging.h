#pragma once

#include <cstdarg>
#include <string>
#include <string_view>

namespace hidock::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

const char* level_to_str(Level lvl);

// Parses "error", "warn", "info", "debug", "verbose". Unknown text maps to Info.
Level parse_level(std::string_view s);
const char* level_name(Level lvl);

// Destination for formatted log lines.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(Level level, const char* tag, std::string_view message) = 0;
};

// E/W to stderr, everything else to stdout: "[I] tag: message".
class StdioLogSink final : public ILogSink {
public:
    void write(Level level, const char* tag, std::string_view message) override;
};

class NullLogSink final : public ILogSink {
public:
    void write(Level, const char*, std::string_view) override {}
};

// Small value type handed to every component that logs.
// A default constructed Logger discards everything.
class Logger {
public:
    Logger() = default;
    Logger(ILogSink* sink, Level minLevel = Level::Info, const char* tag = "hidock")
        : _sink(sink), _minLevel(minLevel), _tag(tag) {}

    // Same sink and level, different component tag.
    Logger with_tag(const char* tag) const { return Logger(_sink, _minLevel, tag); }

    bool enabled(Level level) const noexcept
    {
        return _sink != nullptr && static_cast<int>(level) <= static_cast<int>(_minLevel);
    }

    void vlogf(Level level, const char* fmt, std::va_list args) const;
    void logf(Level level, const char* fmt, ...) const
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
    void log(Level level, std::string_view message) const;

    Level min_level() const noexcept { return _minLevel; }
    const char* tag() const noexcept { return _tag; }

private:
    ILogSink*   _sink{nullptr};
    Level       _minLevel{Level::Info};
    const char* _tag{"hidock"};
};

} // namespace hidock::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define HD_LOGE(logger, fmt, ...) \
    (logger).logf(::hidock::log::Level::Error,   fmt, ##__VA_ARGS__)

#define HD_LOGW(logger, fmt, ...) \
    (logger).logf(::hidock::log::Level::Warn,    fmt, ##__VA_ARGS__)

#define HD_LOGI(logger, fmt, ...) \
    (logger).logf(::hidock::log::Level::Info,    fmt, ##__VA_ARGS__)

#define HD_LOGD(logger, fmt, ...) \
    (logger).logf(::hidock::log::Level::Debug,   fmt, ##__VA_ARGS__)

#define HD_LOGV(logger, fmt, ...) \
    (logger).logf(::hidock::log::Level::Verbose, fmt, ##__VA_ARGS__)
