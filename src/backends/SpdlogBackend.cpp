#include "flowgraph/backends/SpdlogBackend.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flowgraph {

namespace {

constexpr const char* kLoggerName = "flowgraph";

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

SpdlogBackend::SpdlogBackend() {
    // Backends created after a setBackend(nullptr) share the registered logger
    logger_ = spdlog::get(kLoggerName);
    if (!logger_) {
        logger_ = spdlog::stderr_color_mt(kLoggerName);
        logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    logger_->set_level(toSpdlog(logLevelFromEnvironment().value_or(LogLevel::Info)));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(toSpdlog(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

}  // namespace flowgraph
