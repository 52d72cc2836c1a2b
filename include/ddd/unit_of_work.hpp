#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "aggregate.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_dispatcher.hpp"
#include "repository.hpp"

namespace ddd {

enum class UnitOfWorkState { Open, Committing, Committed, RolledBack };

const char* to_string(UnitOfWorkState state);

template<typename T>
class ScopedRepository;

/**
 * Coordinates one business transaction: tracks the aggregates it touches,
 * saves them all on commit, then dispatches their events.
 *
 * Guarantees:
 * - Events are dispatched only after every save succeeded, never if one
 *   failed or the commit was cancelled.
 * - Dispatch order is aggregate registration order, then each aggregate's
 *   append order.
 * - With preflight_check on (the default), a version conflict on any
 *   aggregate is detected before anything is written.
 *
 * Saves go to independent repositories without two-phase commit. A save
 * that fails after earlier saves succeeded leaves those writes in place;
 * saved() lists them so callers can reconcile, typically by reloading and
 * retrying (see run_in_unit_of_work).
 *
 * States: Open -> Committing -> Committed | RolledBack, or
 * Open -> RolledBack. Exactly one terminal transition happens; any later
 * commit() or rollback() throws InvalidStateError.
 *
 * Not thread-safe: one unit of work belongs to one caller.
 *
 * Example:
 *   UnitOfWork unit(dispatcher);
 *   auto users = unit.repository(user_repository);
 *   auto user = users.load("u-1");
 *   user->rename("alice");
 *   unit.commit();
 */
class UnitOfWork {
public:
    /**
     * @param dispatcher Receives the events of a successful commit; must
     *        outlive the unit.
     */
    explicit UnitOfWork(EventDispatcher& dispatcher, UnitOfWorkOptions options = {},
                        CancellationToken cancellation = {});

    /**
     * A unit destroyed while still Open rolls back.
     */
    ~UnitOfWork();

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    /**
     * Track aggregate, to be saved through repository on commit.
     *
     * No-op if this instance is already tracked. The repository must
     * outlive the unit.
     *
     * @throws InvalidStateError if the unit is no longer Open
     * @throws InvalidArgumentError if aggregate is null, or another
     *         instance with the same type and id is tracked
     */
    template<typename T>
    void register_aggregate(std::shared_ptr<T> aggregate, Repository<T>& repository) {
        if (!aggregate) {
            throw InvalidArgumentError("cannot register a null aggregate");
        }
        T* raw = aggregate.get();
        Repository<T>* repo = &repository;
        track(std::move(aggregate),
              [repo, raw]() { repo->check(*raw); },
              [repo, raw]() { repo->save(*raw); });
    }

    /**
     * View of repository whose loads and adds register with this unit.
     */
    template<typename T>
    ScopedRepository<T> repository(Repository<T>& repository) {
        return ScopedRepository<T>(*this, repository);
    }

    /**
     * Save every tracked aggregate in registration order, then drain and
     * dispatch their events.
     *
     * If a check or save fails the unit becomes RolledBack, buffered events
     * are discarded, nothing is dispatched and the failure propagates.
     * Otherwise the unit becomes Committed even if dispatch then fails with
     * DispatchFailureError; persistence is not undone.
     *
     * @throws InvalidStateError if the unit is not Open
     * @throws ConflictError, NotFoundError or any storage error from a save
     * @throws CommitCancelledError if cancellation was observed
     * @throws DispatchFailureError if handlers failed after the commit
     */
    void commit();

    /**
     * Discard tracked aggregates and their buffered events without saving
     * or dispatching anything.
     *
     * @throws InvalidStateError if the unit is not Open
     */
    void rollback();

    UnitOfWorkState state() const { return state_; }

    /**
     * Identifier used to correlate this unit's log lines.
     */
    const std::string& id() const { return id_; }

    bool is_tracked(const AggregateRoot& aggregate) const;

    std::size_t tracked_count() const { return entries_.size(); }

    /**
     * Keys ("type#id") of the aggregates whose save completed during
     * commit(), in order. After a failed or cancelled commit these are the
     * writes that were not undone.
     */
    const std::vector<std::string>& saved() const { return saved_; }

    /**
     * Tracked instance for key, or null.
     */
    std::shared_ptr<AggregateRoot> tracked(const std::string& key) const;

private:
    struct Entry {
        std::shared_ptr<AggregateRoot> aggregate;
        std::function<void()> check;
        std::function<void()> save;
    };

    void track(std::shared_ptr<AggregateRoot> aggregate, std::function<void()> check,
               std::function<void()> save);
    void require_open(const char* operation) const;
    void write_all();
    void dispatch_all();
    void abort_commit(const std::string& reason);
    void discard();

    std::string id_;
    EventDispatcher& dispatcher_;
    UnitOfWorkOptions options_;
    CancellationToken cancellation_;
    UnitOfWorkState state_ = UnitOfWorkState::Open;
    std::vector<Entry> entries_;
    std::map<std::string, std::size_t> index_;
    std::vector<std::string> saved_;
};

/**
 * Repository view scoped to a unit of work.
 *
 * Aggregates obtained here are tracked by the unit; loading an id twice
 * returns the instance already tracked.
 */
template<typename T>
class ScopedRepository {
public:
    using Id = typename T::Id;

    ScopedRepository(UnitOfWork& unit, Repository<T>& repository)
        : unit_(&unit), repository_(&repository) {}

    /**
     * Load and track the aggregate stored under id.
     *
     * @throws NotFoundError if nothing is persisted under id
     */
    std::shared_ptr<T> load(const Id& id) {
        if (auto existing = tracked(id)) {
            return existing;
        }
        auto aggregate = std::make_shared<T>(repository_->load(id));
        unit_->register_aggregate(aggregate, *repository_);
        return aggregate;
    }

    /**
     * Like load(), but returns null when nothing is persisted under id.
     */
    std::shared_ptr<T> find(const Id& id) {
        if (auto existing = tracked(id)) {
            return existing;
        }
        auto found = repository_->find(id);
        if (!found) {
            return nullptr;
        }
        auto aggregate = std::make_shared<T>(std::move(*found));
        unit_->register_aggregate(aggregate, *repository_);
        return aggregate;
    }

    /**
     * Track a new aggregate, to be inserted on commit.
     */
    void add(std::shared_ptr<T> aggregate) {
        unit_->register_aggregate(std::move(aggregate), *repository_);
    }

    Repository<T>& underlying() { return *repository_; }

private:
    std::shared_ptr<T> tracked(const Id& id) const {
        return std::dynamic_pointer_cast<T>(unit_->tracked(aggregate_key<T>(id)));
    }

    UnitOfWork* unit_;
    Repository<T>* repository_;
};

} // namespace ddd
