#pragma once

#include "flowgraph/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace flowgraph {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Supports three usage patterns:
 * 1. Default mode: Uses built-in backend (spdlog if available, DefaultBackend otherwise)
 * 2. Custom mode: Users inject their own ILoggerBackend implementation
 * 3. Capture mode: Enable log capture for programmatic retrieval
 *
 * Thread-safe: backend swaps and the capture buffer are mutex-protected.
 *
 * Example:
 * @code
 * flowgraph::Logger::initialize();
 * flowgraph::Logger::enableCapture(true);
 * LOG_INFO("Layout placed {} nodes", count);
 * auto logs = flowgraph::Logger::getCapturedLogs("Layout");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Install the built-in backend (stderr) unless one is already set
     */
    static void initialize();

    /**
     * @brief Set minimum log level
     */
    static void setLevel(LogLevel level);

    // Logging methods
    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * When enabled, every message is also kept in memory so tests and tools
     * can inspect what the library reported.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Optional substring filter (empty = all logs)
     * @param maxLines Maximum number of lines to return (0 = unlimited, keeps the newest)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const char* tag, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace flowgraph

// Logging macros with std::format support
#define LOG_TRACE(...) flowgraph::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) flowgraph::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  flowgraph::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  flowgraph::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) flowgraph::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
