#include "ddd/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "ddd/errors.hpp"

namespace ddd {

namespace {

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    throw InvalidArgumentError(key + " must be a boolean, got '" + value + "'");
}

int parse_attempts(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    int attempts = 0;
    try {
        attempts = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw InvalidArgumentError(key + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw InvalidArgumentError(key + " must be an integer, got '" + value + "'");
    }
    if (attempts < 1) {
        throw InvalidArgumentError(key + " must be at least 1");
    }
    return attempts;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

Config Config::from_env() {
    Config config;
    if (const char* level = env("DDD_LOG_LEVEL")) {
        config.log_level = parse_log_level(level);
    }
    if (const char* preflight = env("DDD_UOW_PREFLIGHT")) {
        config.unit_of_work.preflight_check = parse_bool("DDD_UOW_PREFLIGHT", preflight);
    }
    if (const char* attempts = env("DDD_UOW_MAX_ATTEMPTS")) {
        config.unit_of_work.max_attempts = parse_attempts("DDD_UOW_MAX_ATTEMPTS", attempts);
    }
    return config;
}

Config Config::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw InvalidArgumentError("configuration must be a JSON object");
    }

    Config config;
    if (document.contains("log_level")) {
        const auto& level = document["log_level"];
        if (!level.is_string()) {
            throw InvalidArgumentError("log_level must be a string");
        }
        config.log_level = parse_log_level(level.get<std::string>());
    }
    if (document.contains("uow_preflight")) {
        const auto& preflight = document["uow_preflight"];
        if (!preflight.is_boolean()) {
            throw InvalidArgumentError("uow_preflight must be a boolean");
        }
        config.unit_of_work.preflight_check = preflight.get<bool>();
    }
    if (document.contains("uow_max_attempts")) {
        const auto& attempts = document["uow_max_attempts"];
        if (!attempts.is_number_integer() || attempts.get<int>() < 1) {
            throw InvalidArgumentError("uow_max_attempts must be a positive integer");
        }
        config.unit_of_work.max_attempts = attempts.get<int>();
    }
    return config;
}

void Config::apply() const {
    set_log_level(log_level);
}

} // namespace ddd
