#include "Logger.h"
#include "CommonUtils.h"
#include "TabsightExceptions.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int> gLevel{static_cast<int>(LogLevel::WARN)};
std::mutex gSinkMutex;
} // namespace

namespace Logger {

void setLevel(LogLevel level) noexcept {
    gLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel level() noexcept {
    return static_cast<LogLevel>(gLevel.load(std::memory_order_relaxed));
}

bool enabled(LogLevel lvl) noexcept {
    if (lvl == LogLevel::OFF) return false;
    return static_cast<int>(lvl) >= gLevel.load(std::memory_order_relaxed);
}

LogLevel parseLevel(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    if (v == "off" || v == "none") return LogLevel::OFF;
    throw Tabsight::ConfigurationException("log_level must be one of: debug, info, warn, error, off");
}

const char* toString(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF: return "off";
    }
    return "off";
}

void log(LogLevel lvl, const std::string& stage, const std::string& message) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(gSinkMutex);
    std::cerr << "[Tabsight][" << stage << "]";
    if (lvl == LogLevel::WARN) std::cerr << " warning:";
    if (lvl == LogLevel::ERROR) std::cerr << " error:";
    std::cerr << " " << message << "\n";
}

} // namespace Logger
