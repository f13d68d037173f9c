#pragma once

#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace flowgraph {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* logLevelToString(LogLevel level);

/// Parse "trace", "debug", "info", "warn"/"warning", "err"/"error" or "off",
/// case-insensitively. Anything else yields std::nullopt.
std::optional<LogLevel> logLevelFromString(std::string_view text);

/// Level named by LOG_LEVEL, falling back to SPDLOG_LEVEL
std::optional<LogLevel> logLevelFromEnvironment();

/**
 * @brief Destination for library diagnostics
 *
 * flowgraph reports rejected connections, skipped layouts and failed loads
 * through this interface. An editor embedding the library can route them into
 * its own console:
 *
 * @code
 * class EditorConsole : public flowgraph::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location&) override {
 *         panel->append(flowgraph::logLevelToString(level), message);
 *     }
 *     void setLevel(LogLevel) override {}
 *     void flush() override {}
 * };
 *
 * flowgraph::Logger::setBackend(std::make_unique<EditorConsole>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted, prefixed with the calling function
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;
    virtual void flush() = 0;
};

}  // namespace flowgraph
