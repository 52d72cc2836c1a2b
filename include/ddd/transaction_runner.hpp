#pragma once

#include <type_traits>
#include <utility>
#include "config.hpp"
#include "errors.hpp"
#include "event_dispatcher.hpp"
#include "logging.hpp"
#include "unit_of_work.hpp"

namespace ddd {

/**
 * Run use_case inside a fresh unit of work and commit it, retrying the whole
 * use-case on ConflictError.
 *
 * Each attempt gets a new UnitOfWork, so the use-case reloads current
 * snapshots and reapplies its mutations. An attempt is retried only if the
 * conflict left nothing written; once a save of the failed commit has gone
 * through, reapplying would mutate that aggregate twice, so a
 * PartialCommitError naming the completed saves propagates instead. After
 * options.max_attempts conflicts the last ConflictError propagates. Every
 * other error, including DispatchFailureError, propagates at once.
 *
 * Example:
 *   run_in_unit_of_work(handlers, config.unit_of_work, [&](UnitOfWork& unit) {
 *       auto users = unit.repository(user_repository);
 *       users.load("u-1")->rename("alice");
 *   });
 *
 * @return whatever use_case returns
 * @throws PartialCommitError if a conflict followed a completed save
 */
template<typename UseCase>
auto run_in_unit_of_work(EventDispatcher& dispatcher, const UnitOfWorkOptions& options,
                         UseCase&& use_case) {
    using Result = std::invoke_result_t<UseCase&, UnitOfWork&>;

    for (int attempt = 1;; ++attempt) {
        UnitOfWork unit(dispatcher, options);
        try {
            if constexpr (std::is_void_v<Result>) {
                use_case(unit);
                unit.commit();
                return;
            } else {
                Result result = use_case(unit);
                unit.commit();
                return result;
            }
        } catch (const ConflictError& e) {
            if (!unit.saved().empty()) {
                log_error("unit_of_work", "conflict_after_partial_save",
                          {{"attempt", attempt}, {"saved", unit.saved()}, {"error", e.what()}});
                throw PartialCommitError(e, unit.saved());
            }
            if (attempt >= options.max_attempts) {
                log_warn("unit_of_work", "conflict_retries_exhausted",
                         {{"attempts", attempt}, {"error", e.what()}});
                throw;
            }
            log_info("unit_of_work", "conflict_retry",
                     {{"attempt", attempt}, {"error", e.what()}});
        }
    }
}

} // namespace ddd
