#pragma once

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace ddd {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * Parse "debug", "info", "warn" or "error" (case-insensitive).
 * @throws InvalidArgumentError for anything else
 */
LogLevel parse_log_level(const std::string& level);

const char* to_string(LogLevel level);

/**
 * Process-wide threshold; lines below it are dropped. Defaults to Info.
 */
void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Redirect log output (defaults to std::cout). Pass nullptr to restore the
 * default. The stream must outlive every later log call.
 */
void set_log_sink(std::ostream* sink);

/**
 * Write one JSON object per line:
 * {"level", "message", "component", "timestamp", ...fields}.
 *
 * Never throws: it runs inside commit, destructors and handler catch blocks.
 * A line that cannot be written is reported on std::cerr instead.
 */
void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields = {}) noexcept;

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, component, message, fields);
}

} // namespace ddd
