#pragma once

#include <string>

enum class LogLevel { DEBUG, INFO, WARN, ERROR, OFF };

namespace Logger {
// Process-wide sink writing "[Tabsight][<stage>] <message>" lines to std::cerr.
// Diagnostic side channel only: nothing computed may depend on it.
void setLevel(LogLevel level) noexcept;
LogLevel level() noexcept;
bool enabled(LogLevel level) noexcept;

/**
 * @brief Parses debug|info|warn|error|off (case-insensitive).
 * @throws Tabsight::ConfigurationException on unknown names.
 */
LogLevel parseLevel(const std::string& name);
const char* toString(LogLevel level) noexcept;

void log(LogLevel level, const std::string& stage, const std::string& message);
inline void debug(const std::string& stage, const std::string& message) { log(LogLevel::DEBUG, stage, message); }
inline void info(const std::string& stage, const std::string& message) { log(LogLevel::INFO, stage, message); }
inline void warn(const std::string& stage, const std::string& message) { log(LogLevel::WARN, stage, message); }
inline void error(const std::string& stage, const std::string& message) { log(LogLevel::ERROR, stage, message); }
} // namespace Logger
