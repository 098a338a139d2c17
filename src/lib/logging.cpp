#include "hidock/core/logging.h"

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace hidock::log {

const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

const char* level_name(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "error";
    case Level::Warn:    return "warn";
    case Level::Info:    return "info";
    case Level::Debug:   return "debug";
    case Level::Verbose: return "verbose";
    }
    return "info";
}

Level parse_level(std::string_view s)
{
    if (s == "error")   return Level::Error;
    if (s == "warn")    return Level::Warn;
    if (s == "debug")   return Level::Debug;
    if (s == "verbose") return Level::Verbose;
    return Level::Info;
}

void StdioLogSink::write(Level level, const char* tag, std::string_view message)
{
    FILE* out = (level == Level::Error || level == Level::Warn)
        ? stderr
        : stdout;

    std::fprintf(out, "[%s] %s: %.*s\n",
                 level_to_str(level),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
}

void Logger::vlogf(Level level, const char* fmt, std::va_list args) const
{
    if (!enabled(level) || !fmt) {
        return;
    }

    std::va_list copy;
    va_copy(copy, args);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n < 0) {
        return;
    }

    std::vector<char> buf(static_cast<std::size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    _sink->write(level, _tag, std::string_view(buf.data(), static_cast<std::size_t>(n)));
}

void Logger::logf(Level level, const char* fmt, ...) const
{
    if (!enabled(level)) {
        return;
    }
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, fmt, args);
    va_end(args);
}

void Logger::log(Level level, std::string_view message) const
{
    if (!enabled(level)) {
        return;
    }
    _sink->write(level, _tag, message);
}

} // namespace hidock::log
