#include "flowgraph/backends/DefaultBackend.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace flowgraph {

namespace {

const char* colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Off: return "";
    }
    return "";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace

DefaultBackend::DefaultBackend()
    : level_(logLevelFromEnvironment().value_or(LogLevel::Info)) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ == LogLevel::Off || level < level_) {
        return;
    }
    std::cerr << "[" << timestamp() << "] [" << colorFor(level)
              << logLevelToString(level) << "\033[0m] " << message << '\n';
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

}  // namespace flowgraph
