#include "ddd/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include "ddd/errors.hpp"
#include "ddd/helpers.hpp"

namespace ddd {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sink_mutex;
std::ostream* g_sink = nullptr;

} // namespace

LogLevel parse_log_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    throw InvalidArgumentError("unknown log level: " + level);
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void set_log_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = sink;
}

void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields) noexcept {
    if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed)) {
        return;
    }

    try {
        nlohmann::json log_entry = {
            {"level", to_string(level)},
            {"message", message},
            {"component", component},
            {"timestamp", helpers::to_iso8601(std::chrono::system_clock::now())}
        };
        if (fields.is_object()) {
            for (auto& [key, value] : fields.items()) {
                log_entry[key] = value;
            }
        }

        // Ids and messages are caller-supplied bytes; invalid UTF-8 becomes U+FFFD.
        const std::string line =
            log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        std::lock_guard<std::mutex> lock(g_sink_mutex);
        std::ostream& out = g_sink ? *g_sink : std::cout;
        out << line << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "ddd: failed to write log line for " << component << "/" << message
                  << ": " << e.what() << std::endl;
    }
}

} // namespace ddd
