#pragma once

#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string_view>

namespace blockflow {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error" and "none".
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Defaults to stderr. The stream is not owned.
    void SetOutput(std::FILE* out);

    // printf-style logging
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

#define LogDebug(...) ::blockflow::Logger::Instance().LogWithSource(::blockflow::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::blockflow::Logger::Instance().LogWithSource(::blockflow::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::blockflow::Logger::Instance().LogWithSource(::blockflow::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::blockflow::Logger::Instance().LogWithSource(::blockflow::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace blockflow
