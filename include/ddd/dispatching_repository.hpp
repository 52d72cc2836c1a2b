#pragma once

#include <optional>
#include <vector>
#include "event_dispatcher.hpp"
#include "logging.hpp"
#include "repository.hpp"

namespace ddd {

/**
 * Repository facade that dispatches an aggregate's events right after the
 * aggregate itself is persisted: a unit of work of exactly one aggregate,
 * for use-cases that touch a single aggregate.
 *
 * If the save fails the events stay buffered on the aggregate and nothing
 * is dispatched.
 *
 * Example:
 *   DispatchingRepository<User> users(store, handlers);
 *   auto user = users.load("u-1");
 *   user.rename("alice");
 *   users.save(user);   // persists, then dispatches Renamed
 */
template<typename T>
class DispatchingRepository {
public:
    using Id = typename T::Id;

    /**
     * Both collaborators must outlive the facade.
     */
    DispatchingRepository(Repository<T>& repository, EventDispatcher& dispatcher)
        : repository_(repository), dispatcher_(dispatcher) {}

    T load(const Id& id) const { return repository_.load(id); }

    std::optional<T> find(const Id& id) const { return repository_.find(id); }

    /**
     * Persist aggregate, then drain and dispatch its events.
     *
     * @throws ConflictError on a version mismatch (events stay buffered)
     * @throws DispatchFailureError if handlers failed after the save
     */
    void save(T& aggregate) {
        repository_.save(aggregate);
        static_cast<AggregateRoot&>(aggregate).mark_persisted();
        dispatch_pending(aggregate);
    }

    /**
     * Delete aggregate, then drain and dispatch its events.
     */
    void remove(T& aggregate) {
        repository_.remove(aggregate);
        dispatch_pending(aggregate);
    }

    Repository<T>& underlying() { return repository_; }

private:
    void dispatch_pending(T& aggregate) {
        auto events = static_cast<AggregateRoot&>(aggregate).drain_events();
        if (events.empty()) {
            return;
        }
        log_debug("repository", "dispatching_events",
                  {{"aggregate", aggregate.key()}, {"events", events.size()}});
        dispatcher_.dispatch(events);
    }

    Repository<T>& repository_;
    EventDispatcher& dispatcher_;
};

} // namespace ddd
