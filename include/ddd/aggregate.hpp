#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "ddd/domain.pb.h"
#include "entity.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "state_router.hpp"

namespace ddd {

class UnitOfWork;
template<typename T> class InMemoryRepository;
template<typename T> class DispatchingRepository;

/**
 * Type-erased view of an aggregate root: identity, version and the buffer
 * of events raised since the last drain.
 *
 * This is what UnitOfWork tracks; domain code derives from Aggregate<>.
 * The buffer and the persisted version are written only by the unit of
 * work and the bundled repositories.
 */
class AggregateRoot {
public:
    static constexpr std::size_t kDefaultMaxPendingEvents = 1024;

    virtual ~AggregateRoot() = default;

    /**
     * Name of the aggregate type, e.g. "user".
     */
    virtual std::string aggregate_type() const = 0;

    /**
     * Identity rendered as a string.
     */
    virtual std::string aggregate_id() const = 0;

    /**
     * "type#id", unique within a unit of work.
     */
    std::string key() const { return aggregate_type() + "#" + aggregate_id(); }

    /**
     * Number of successful mutations over the aggregate's lifetime.
     */
    std::uint64_t version() const { return version_; }

    /**
     * Version last confirmed by a repository (on load or save).
     */
    std::uint64_t persisted_version() const { return persisted_version_; }

    bool has_pending_events() const { return !pending_events_.empty(); }

    const std::vector<DomainEvent>& pending_events() const { return pending_events_; }

protected:
    friend class UnitOfWork;
    template<typename T> friend class InMemoryRepository;
    template<typename T> friend class DispatchingRepository;

    AggregateRoot() = default;

    /**
     * Restore at a version read back from storage.
     */
    explicit AggregateRoot(std::uint64_t version)
        : version_(version), persisted_version_(version) {}

    AggregateRoot(const AggregateRoot&) = default;
    AggregateRoot& operator=(const AggregateRoot&) = default;
    AggregateRoot(AggregateRoot&&) = default;
    AggregateRoot& operator=(AggregateRoot&&) = default;

    /**
     * Capacity of the event buffer; mutations that would exceed it are
     * rejected.
     */
    virtual std::size_t max_pending_events() const { return kDefaultMaxPendingEvents; }

    /**
     * Ensure the buffer can take count more events without reallocating.
     */
    void reserve_events(std::size_t count) {
        pending_events_.reserve(pending_events_.size() + count);
    }

    /**
     * Append the events of one successful mutation and bump the version.
     * Callers reserve capacity first.
     */
    void record(std::vector<DomainEvent>&& events) {
        for (auto& event : events) {
            pending_events_.push_back(std::move(event));
        }
        ++version_;
    }

    /**
     * Take the buffered events in append order, leaving the buffer empty.
     *
     * Called by UnitOfWork once every save of a commit has succeeded. A
     * second call without an intervening mutation returns nothing.
     */
    std::vector<DomainEvent> drain_events() {
        std::vector<DomainEvent> drained;
        drained.swap(pending_events_);
        return drained;
    }

    /**
     * Drop buffered events without delivering them.
     */
    void discard_events() { pending_events_.clear(); }

    /**
     * Record that the current version is now the persisted one.
     */
    void mark_persisted() { persisted_version_ = version_; }

private:
    std::uint64_t version_ = 0;
    std::uint64_t persisted_version_ = 0;
    std::vector<DomainEvent> pending_events_;
};

/**
 * Base class for aggregates whose state is evolved by events.
 *
 * Public mutation methods call apply_mutation() with a decision function.
 * The decision inspects the current state, throws InvariantViolationError
 * to reject, and returns the event (or vector of events) describing the
 * change. Events are applied through state_router() onto a copy of the
 * state, and check_invariants() validates the result; only then are state,
 * version and event buffer updated together.
 *
 * Usage:
 *   class User : public Aggregate<std::string, UserState> {
 *   public:
 *       DDD_AGGREGATE("user")
 *
 *       explicit User(std::string id) : Aggregate(std::move(id)) {}
 *
 *       void rename(const std::string& name) {
 *           apply_mutation([&](const UserState& state) {
 *               validation::require_not_empty(name, "name");
 *               Renamed event;
 *               event.set_old_name(state.name());
 *               event.set_new_name(name);
 *               return event;
 *           });
 *       }
 *
 *   protected:
 *       const StateRouter<UserState>& state_router() const override {
 *           static const auto router = StateRouter<UserState>()
 *               .on<Renamed>([](UserState& state, const Renamed& event) {
 *                   state.set_name(event.new_name());
 *               });
 *           return router;
 *       }
 *   };
 */
template<typename IdT, typename StateT>
class Aggregate : public Entity<IdT>, public AggregateRoot {
public:
    using Id = IdT;
    using State = StateT;

    std::string aggregate_id() const override { return this->id_string(); }

    const State& state() const { return state_; }

protected:
    explicit Aggregate(Id id, State initial = State{})
        : Entity<Id>(std::move(id)), state_(std::move(initial)) {}

    /**
     * Restore a snapshot read back from storage.
     */
    Aggregate(Id id, State state, std::uint64_t version)
        : Entity<Id>(std::move(id)), AggregateRoot(version), state_(std::move(state)) {}

    /**
     * Appliers for every event type this aggregate raises.
     */
    virtual const StateRouter<State>& state_router() const = 0;

    /**
     * Domain invariants a candidate state must satisfy. Throw
     * InvariantViolationError to reject the mutation that produced it.
     */
    virtual void check_invariants(const State& /*candidate*/) const {}

    /**
     * Run one mutation with all-or-nothing semantics.
     *
     * @throws InvariantViolationError if the decision, an applier or
     *         check_invariants rejects it, or it produces no events, or the
     *         event buffer is full.
     * @throws InvalidArgumentError if an event has no applier in
     *         state_router() or its payload does not unpack.
     * Either way the aggregate is unchanged.
     */
    template<typename Decide>
    void apply_mutation(Decide&& decide) {
        std::vector<google::protobuf::Any> payloads;
        pack_into(payloads, decide(static_cast<const State&>(state_)));

        if (payloads.empty()) {
            throw InvariantViolationError(key() + ": mutation produced no events");
        }
        if (pending_events().size() + payloads.size() > max_pending_events()) {
            throw InvariantViolationError(key() + ": event buffer full (" +
                                          std::to_string(max_pending_events()) +
                                          " pending events)");
        }

        State candidate = state_;
        for (const auto& payload : payloads) {
            state_router().apply(candidate, payload);
        }
        check_invariants(candidate);

        auto next_version = version() + 1;
        auto occurred_at = helpers::now();
        std::vector<DomainEvent> events;
        events.reserve(payloads.size());
        for (auto& payload : payloads) {
            DomainEvent event;
            event.set_event_id(helpers::generate_uuid());
            event.set_type(helpers::tag_from_url(payload.type_url()));
            *event.mutable_occurred_at() = occurred_at;
            *event.mutable_payload() = std::move(payload);
            event.set_aggregate_type(aggregate_type());
            event.set_aggregate_id(aggregate_id());
            event.set_aggregate_version(next_version);
            events.push_back(std::move(event));
        }
        reserve_events(events.size());

        state_ = std::move(candidate);
        this->touch();
        record(std::move(events));
    }

private:
    static void pack_into(std::vector<google::protobuf::Any>& out,
                          const google::protobuf::Any& payload) {
        out.push_back(payload);
    }

    template<typename Message>
    static void pack_into(std::vector<google::protobuf::Any>& out, const Message& message) {
        out.push_back(helpers::pack_any(message));
    }

    template<typename Message>
    static void pack_into(std::vector<google::protobuf::Any>& out,
                          const std::vector<Message>& messages) {
        for (const auto& message : messages) {
            pack_into(out, message);
        }
    }

    State state_;
};

} // namespace ddd
