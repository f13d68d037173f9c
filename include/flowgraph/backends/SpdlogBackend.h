#pragma once

#include "flowgraph/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace flowgraph {

/// Routes Logger output to a shared "flowgraph" spdlog logger writing to
/// stderr. The initial level comes from LOG_LEVEL / SPDLOG_LEVEL, else Info.
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flowgraph
