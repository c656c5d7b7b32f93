#pragma once

#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string_view>

namespace stash {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;
    bool Enabled(LogLevel lvl) const { return lvl >= Level(); }

    // Defaults to stderr. The stream is not owned.
    void SetOutput(std::FILE* out);

    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::stash::Logger::Instance().LogWithSource(::stash::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::stash::Logger::Instance().LogWithSource(::stash::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::stash::Logger::Instance().LogWithSource(::stash::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::stash::Logger::Instance().LogWithSource(::stash::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace stash
