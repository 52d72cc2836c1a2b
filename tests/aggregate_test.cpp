#include <gtest/gtest.h>
#include <string>
#include <type_traits>
#include <utility>
#include "support/test_domain.hpp"

using namespace ddd;
using namespace ddd::testing;

// =============================================================================
// Mutation Tests
// =============================================================================

TEST(AggregateTest, NewAggregate_ShouldStartAtVersionZeroWithNoEvents) {
    // When I create a user
    User user("u-1");

    // Then it has no history
    EXPECT_EQ(user.version(), 0u);
    EXPECT_EQ(user.persisted_version(), 0u);
    EXPECT_FALSE(user.has_pending_events());
    EXPECT_EQ(user.key(), "user#u-1");
}

TEST(AggregateTest, SuccessfulMutation_ShouldUpdateStateVersionAndBuffer) {
    // Given a new user
    User user("u-1");

    // When I register it
    user.register_user("alice");

    // Then state, version and buffer change together
    EXPECT_EQ(user.state().name(), "alice");
    EXPECT_TRUE(user.state().active());
    EXPECT_EQ(user.version(), 1u);
    ASSERT_EQ(user.pending_events().size(), 1u);

    const auto& event = user.pending_events().front();
    EXPECT_EQ(event.type(), "UserRegistered");
    EXPECT_EQ(event.aggregate_type(), "user");
    EXPECT_EQ(event.aggregate_id(), "u-1");
    EXPECT_EQ(event.aggregate_version(), 1u);
    EXPECT_EQ(event.event_id().size(), 36u);
    EXPECT_GT(event.occurred_at().seconds(), 0);

    UserRegistered payload;
    ASSERT_TRUE(event.payload().UnpackTo(&payload));
    EXPECT_EQ(payload.name(), "alice");
}

TEST(AggregateTest, RejectedMutation_ShouldLeaveAggregateUnchanged) {
    // Given a registered user
    User user("u-1");
    user.register_user("alice");
    auto updated_at = user.updated_at();

    // When a rename is rejected by the decision
    EXPECT_THROW(user.rename(""), InvariantViolationError);

    // Then nothing changed
    EXPECT_EQ(user.state().name(), "alice");
    EXPECT_EQ(user.version(), 1u);
    EXPECT_EQ(user.pending_events().size(), 1u);
    EXPECT_EQ(user.updated_at(), updated_at);
}

TEST(AggregateTest, InvariantCheckFailure_ShouldLeaveAggregateUnchanged) {
    // Given a registered user
    User user("u-1");
    user.register_user("alice");

    // When the candidate state breaks an invariant
    try {
        user.rename_to_blank();
        FAIL() << "expected InvariantViolationError";
    } catch (const InvariantViolationError& e) {
        // Then the error names the invariant
        EXPECT_NE(std::string(e.what()).find("must have a name"), std::string::npos);
    }

    // And state, version and buffer are untouched
    EXPECT_EQ(user.state().name(), "alice");
    EXPECT_EQ(user.version(), 1u);
    EXPECT_EQ(user.pending_events().size(), 1u);
}

TEST(AggregateTest, MutationWithoutEvents_ShouldBeRejected) {
    // Given a counter
    Counter counter(7);

    // When a mutation decides on no events
    EXPECT_THROW(counter.increment_each({}), InvariantViolationError);

    // Then the version did not move
    EXPECT_EQ(counter.version(), 0u);
}

TEST(AggregateTest, MultiEventMutation_ShouldBumpVersionOnce) {
    // Given a new user
    User user("u-1");

    // When one mutation raises two events
    user.register_as("alice", "Alice A.");

    // Then both are buffered in order with the same version
    ASSERT_EQ(user.pending_events().size(), 2u);
    EXPECT_EQ(user.pending_events()[0].type(), "UserRegistered");
    EXPECT_EQ(user.pending_events()[1].type(), "Renamed");
    EXPECT_EQ(user.pending_events()[0].aggregate_version(), 1u);
    EXPECT_EQ(user.pending_events()[1].aggregate_version(), 1u);
    EXPECT_EQ(user.version(), 1u);
    EXPECT_EQ(user.state().name(), "Alice A.");
}

TEST(AggregateTest, NumericId_ShouldRenderInKeyAndEvents) {
    // Given a counter with a numeric id
    Counter counter(42);

    // When I increment it
    counter.increment(5);

    // Then the id is rendered as text
    EXPECT_EQ(counter.key(), "counter#42");
    EXPECT_EQ(counter.pending_events().front().aggregate_id(), "42");
    EXPECT_EQ(counter.state().value(), 5);
}

// =============================================================================
// Event Buffer Tests
// =============================================================================

TEST(AggregateTest, DrainEvents_ShouldReturnEventsInAppendOrder) {
    // Given a user with three mutations
    Inspectable<User> user("u-1");
    user.register_user("alice");
    user.rename("bob");
    user.deactivate();

    // When I drain the buffer
    auto events = user.drain_events();

    // Then I get every event in order, with increasing versions
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type(), "UserRegistered");
    EXPECT_EQ(events[1].type(), "Renamed");
    EXPECT_EQ(events[2].type(), "UserDeactivated");
    EXPECT_EQ(events[0].aggregate_version(), 1u);
    EXPECT_EQ(events[2].aggregate_version(), 3u);
    EXPECT_FALSE(user.has_pending_events());
}

TEST(AggregateTest, DrainTwice_ShouldReturnNothingTheSecondTime) {
    // Given a user whose events were drained
    Inspectable<User> user("u-1");
    user.register_user("alice");
    user.drain_events();

    // When I drain again
    auto second = user.drain_events();

    // Then nothing comes back and the version stays
    EXPECT_TRUE(second.empty());
    EXPECT_EQ(user.version(), 1u);
}

TEST(AggregateTest, DiscardEvents_ShouldKeepStateAndVersion) {
    // Given a renamed user
    Inspectable<User> user("u-1");
    user.register_user("alice");
    user.rename("bob");

    // When I discard the buffer
    user.discard_events();

    // Then only the buffer is cleared
    EXPECT_FALSE(user.has_pending_events());
    EXPECT_EQ(user.version(), 2u);
    EXPECT_EQ(user.state().name(), "bob");
}

TEST(AggregateTest, FullBuffer_ShouldRejectFurtherMutations) {
    // Given a counter whose buffer is full
    Inspectable<Counter> counter(1);
    for (std::size_t i = 0; i < Counter::kBufferSize; ++i) {
        counter.increment(1);
    }

    // When I mutate once more
    EXPECT_THROW(counter.increment(1), InvariantViolationError);

    // Then the rejected mutation left no trace
    EXPECT_EQ(counter.pending_events().size(), Counter::kBufferSize);
    EXPECT_EQ(counter.version(), Counter::kBufferSize);
    EXPECT_EQ(counter.state().value(), 3);

    // And draining makes room again
    counter.drain_events();
    EXPECT_NO_THROW(counter.increment(1));
}

TEST(AggregateTest, MultiEventMutationOverCapacity_ShouldBeRejectedWhole) {
    // Given a counter with one event buffered
    Counter counter(1);
    counter.increment(1);

    // When one mutation would add three more
    EXPECT_THROW(counter.increment_each({1, 2, 3}), InvariantViolationError);

    // Then none of them were applied
    EXPECT_EQ(counter.pending_events().size(), 1u);
    EXPECT_EQ(counter.state().value(), 1);
}

TEST(AggregateTest, UnroutedEvent_ShouldBeRejectedAndLeaveNoTrace) {
    // Given a registered user
    User user("u-1");
    user.register_user("alice");

    // When a mutation raises an event the user has no applier for
    EXPECT_THROW(user.record_unrouted(5), InvalidArgumentError);

    // Then state, version and buffer are unchanged
    EXPECT_EQ(user.version(), 1u);
    EXPECT_EQ(user.pending_events().size(), 1u);
    EXPECT_EQ(user.state().name(), "alice");
}

namespace {

template<typename T, typename = void>
struct CanDrain : std::false_type {};

template<typename T>
struct CanDrain<T, std::void_t<decltype(std::declval<T&>().drain_events())>> : std::true_type {};

template<typename T, typename = void>
struct CanMarkPersisted : std::false_type {};

template<typename T>
struct CanMarkPersisted<T, std::void_t<decltype(std::declval<T&>().mark_persisted())>>
    : std::true_type {};

} // namespace

TEST(AggregateTest, EventBuffer_ShouldNotBeWritableByDomainCallers) {
    // Then a plain aggregate handle cannot drain its buffer or move its persisted version
    EXPECT_FALSE(CanDrain<User>::value);
    EXPECT_FALSE(CanMarkPersisted<User>::value);
    EXPECT_FALSE(CanDrain<AggregateRoot>::value);

    // And a type that opts in can
    EXPECT_TRUE(CanDrain<Inspectable<User>>::value);
    EXPECT_TRUE(CanMarkPersisted<Inspectable<User>>::value);
}

TEST(AggregateTest, MarkPersisted_ShouldTrackPersistedVersion) {
    // Given a user mutated twice
    Inspectable<User> user("u-1");
    user.register_user("alice");
    user.rename("bob");

    // When it is marked persisted
    user.mark_persisted();

    // Then the persisted version catches up
    EXPECT_EQ(user.persisted_version(), 2u);
}

// =============================================================================
// StateRouter Tests
// =============================================================================

TEST(StateRouterTest, Apply_UnregisteredEvent_ShouldThrowInvalidArgument) {
    // Given a router that only knows Incremented
    auto router = StateRouter<CounterState>().on<Incremented>(
        [](CounterState& state, const Incremented& event) {
            state.set_value(state.value() + event.amount());
        });
    CounterState state;

    // When I apply an event it does not handle
    Renamed renamed;
    EXPECT_THROW(router.apply(state, helpers::pack_any(renamed)), InvalidArgumentError);

    // Then the state is untouched
    EXPECT_EQ(state.value(), 0);
}

TEST(StateRouterTest, Apply_RegisteredEvent_ShouldInvokeApplier) {
    // Given a router for Incremented
    auto router = StateRouter<CounterState>().on<Incremented>(
        [](CounterState& state, const Incremented& event) {
            state.set_value(state.value() + event.amount());
        });
    CounterState state;

    // When I apply two increments
    Incremented event;
    event.set_amount(4);
    router.apply(state, helpers::pack_any(event));
    router.apply(state, helpers::pack_any(event));

    // Then both were applied
    EXPECT_EQ(state.value(), 8);
    EXPECT_TRUE(router.handles("Incremented"));
    EXPECT_FALSE(router.handles("Renamed"));
}
