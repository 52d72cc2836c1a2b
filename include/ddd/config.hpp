#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "logging.hpp"

namespace ddd {

/**
 * Tuning for UnitOfWork commits and the transaction runner.
 */
struct UnitOfWorkOptions {
    /** Compare every tracked aggregate's version before the first write. */
    bool preflight_check = true;

    /** Attempts run_in_unit_of_work makes before giving up on Conflict. */
    int max_attempts = 3;
};

/**
 * Library configuration.
 *
 * Recognised keys (environment variable / JSON key):
 *   DDD_LOG_LEVEL        / log_level          debug|info|warn|error
 *   DDD_UOW_PREFLIGHT    / uow_preflight      true|false
 *   DDD_UOW_MAX_ATTEMPTS / uow_max_attempts   positive integer
 */
struct Config {
    LogLevel log_level = LogLevel::Info;
    UnitOfWorkOptions unit_of_work;

    /**
     * Build a configuration from the process environment. Unset variables
     * keep their defaults.
     *
     * @throws InvalidArgumentError if a variable holds an invalid value
     */
    static Config from_env();

    /**
     * Build a configuration from a JSON object. Missing keys keep their
     * defaults.
     *
     * @throws InvalidArgumentError if the document or a value is invalid
     */
    static Config from_json(const nlohmann::json& document);

    /**
     * Install process-wide settings (the log threshold).
     */
    void apply() const;
};

} // namespace ddd
