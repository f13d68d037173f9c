#pragma once

#include "flowgraph/common/ILoggerBackend.h"
#include <mutex>

namespace flowgraph {

/// Timestamped, coloured lines on stderr. Used when the library is built
/// without FLOWGRAPH_USE_SPDLOG.
///
/// stdout is left to callers: flowgraph_cli prints workflow JSON there.
class DefaultBackend : public ILoggerBackend {
public:
    /// Starts at Info unless LOG_LEVEL / SPDLOG_LEVEL names another level
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel level_;
    std::mutex mutex_;
};

}  // namespace flowgraph
