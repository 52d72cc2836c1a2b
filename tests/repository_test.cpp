#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "support/test_domain.hpp"

using namespace ddd;
using namespace ddd::testing;

// =============================================================================
// InMemoryRepository Tests
// =============================================================================

class InMemoryRepositoryTest : public ::testing::Test {
protected:
    InMemoryRepository<User> users;
};

TEST_F(InMemoryRepositoryTest, Load_UnknownId_ShouldThrowNotFound) {
    // When I load an id that was never saved
    try {
        users.load("missing");
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        // Then the error names the aggregate
        EXPECT_EQ(std::string(e.what()), "user#missing not found");
        EXPECT_TRUE(e.is_not_found());
    }
    EXPECT_FALSE(users.find("missing").has_value());
    EXPECT_FALSE(users.exists("missing"));
}

TEST_F(InMemoryRepositoryTest, SaveThenLoad_ShouldReturnSnapshotWithoutEvents) {
    // Given a registered user that was saved
    User user("u-1");
    user.register_user("alice");
    users.save(user);

    // When I load it
    auto loaded = users.load("u-1");

    // Then the snapshot carries state and version but no events
    EXPECT_EQ(loaded.state().name(), "alice");
    EXPECT_EQ(loaded.version(), 1u);
    EXPECT_EQ(loaded.persisted_version(), 1u);
    EXPECT_FALSE(loaded.has_pending_events());
    EXPECT_EQ(users.save_count(), 1u);
}

TEST_F(InMemoryRepositoryTest, Save_ShouldNotTouchTheCallersAggregate) {
    // Given a registered user
    User user("u-1");
    user.register_user("alice");

    // When it is saved
    users.save(user);

    // Then its events and persisted version are left for the caller
    EXPECT_TRUE(user.has_pending_events());
    EXPECT_EQ(user.persisted_version(), 0u);
}

TEST_F(InMemoryRepositoryTest, StaleWrite_ShouldConflict) {
    // Given two copies of the same user loaded at version 1
    seed_user(users, "u-1", "alice");
    auto first = users.load("u-1");
    auto second = users.load("u-1");

    // When the first copy is renamed and saved
    first.rename("bob");
    users.save(first);

    // Then saving the second copy conflicts
    second.rename("carol");
    try {
        users.save(second);
        FAIL() << "expected ConflictError";
    } catch (const ConflictError& e) {
        EXPECT_EQ(e.expected_version(), 1u);
        EXPECT_EQ(e.actual_version(), 2u);
        EXPECT_EQ(e.status_code(), grpc::StatusCode::ABORTED);
    }

    // And the stored state is the first writer's
    EXPECT_EQ(users.load("u-1").state().name(), "bob");
}

TEST_F(InMemoryRepositoryTest, InsertOverExistingId_ShouldConflict) {
    // Given a stored user
    seed_user(users, "u-1", "alice");

    // When a brand new aggregate with the same id is saved
    User duplicate("u-1");
    duplicate.register_user("mallory");

    // Then it conflicts with version 0 expected
    EXPECT_THROW(users.save(duplicate), ConflictError);
}

TEST_F(InMemoryRepositoryTest, OptimisticRoundTrip_ShouldAdvanceVersion) {
    // Given a stored user
    seed_user(users, "u-1", "alice");

    // When I load, rename and save it twice
    for (const std::string name : {"bob", "carol"}) {
        auto user = users.load("u-1");
        user.rename(name);
        users.save(user);
    }

    // Then the store is at version 3
    auto loaded = users.load("u-1");
    EXPECT_EQ(loaded.version(), 3u);
    EXPECT_EQ(loaded.state().name(), "carol");
}

TEST_F(InMemoryRepositoryTest, Check_ShouldNotWrite) {
    // Given a stale copy
    seed_user(users, "u-1", "alice");
    auto stale = users.load("u-1");
    auto fresh = users.load("u-1");
    fresh.rename("bob");
    users.save(fresh);

    // When I check both
    // Then only the stale one conflicts, and nothing is written
    EXPECT_THROW(users.check(stale), ConflictError);
    EXPECT_NO_THROW(users.check(users.load("u-1")));
    EXPECT_EQ(users.save_count(), 2u);
}

TEST_F(InMemoryRepositoryTest, Remove_ShouldDeleteAndRequireCurrentVersion) {
    // Given a stored user and a stale copy of it
    seed_user(users, "u-1", "alice");
    auto stale = users.load("u-1");
    auto current = users.load("u-1");
    current.rename("bob");
    users.save(current);

    // When the stale copy is removed
    EXPECT_THROW(users.remove(stale), ConflictError);

    // Then the current copy can still be removed
    auto latest = users.load("u-1");
    users.remove(latest);
    EXPECT_FALSE(users.exists("u-1"));
    EXPECT_THROW(users.remove(latest), NotFoundError);
}

TEST_F(InMemoryRepositoryTest, ListAndCount_ShouldPageInIdOrder) {
    // Given five stored users
    for (const std::string id : {"u-3", "u-1", "u-5", "u-2", "u-4"}) {
        seed_user(users, id, "name-" + id);
    }

    // When I page through them
    auto page = users.list(1, 2);

    // Then pages follow id order
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].id(), "u-2");
    EXPECT_EQ(page[1].id(), "u-3");
    EXPECT_EQ(users.count(), 5u);
    EXPECT_FALSE(users.is_empty());
    EXPECT_TRUE(users.list(5, 10).empty());
    EXPECT_TRUE(users.list(0, 0).empty());
}

TEST_F(InMemoryRepositoryTest, ConcurrentWriters_ShouldAdmitExactlyOneWriterPerVersion) {
    // Given a stored user
    seed_user(users, "u-1", "alice");

    // When eight threads race to rename the same version
    std::atomic<int> conflicts{0};
    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([this, i, &conflicts] {
            auto user = users.load("u-1");
            if (user.version() != 1) {
                ++conflicts;
                return;
            }
            user.rename("writer-" + std::to_string(i));
            try {
                users.save(user);
            } catch (const ConflictError&) {
                ++conflicts;
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    // Then exactly one writer won
    EXPECT_EQ(conflicts.load(), 7);
    EXPECT_EQ(users.load("u-1").version(), 2u);
}

TEST_F(InMemoryRepositoryTest, NumericIds_ShouldBeSupported) {
    // Given a counter repository
    InMemoryRepository<Counter> counters;
    Counter counter(9);
    counter.increment(2);
    counters.save(counter);

    // Then it loads by numeric id
    EXPECT_EQ(counters.load(9).state().value(), 2);
    EXPECT_THROW(counters.load(10), NotFoundError);
}

// =============================================================================
// Range Operation Tests
// =============================================================================

TEST_F(InMemoryRepositoryTest, SaveRange_ShouldSaveEveryAggregateInOrder) {
    // Given three new users
    std::vector<User> batch;
    for (const std::string id : {"u-1", "u-2", "u-3"}) {
        User user(id);
        user.register_user("name-" + id);
        batch.push_back(user);
    }

    // When I save them as a range
    users.save_range(batch);

    // Then all of them are stored
    EXPECT_EQ(users.count(), 3u);
    EXPECT_EQ(users.load("u-2").state().name(), "name-u-2");
    EXPECT_EQ(users.save_count(), 3u);
}

TEST(RepositoryRangeTest, SaveRange_ShouldStopAtTheFirstFailure) {
    // Given a store that fails for the second of three users
    FaultyRepository<User> repository;
    repository.failing_ids = {"u-2"};
    std::vector<User> batch;
    for (const std::string id : {"u-1", "u-2", "u-3"}) {
        User user(id);
        user.register_user("alice");
        batch.push_back(user);
    }

    // When I save the range
    EXPECT_THROW(repository.save_range(batch), std::runtime_error);

    // Then the first stays saved and the third was never attempted
    EXPECT_TRUE(repository.exists("u-1"));
    EXPECT_FALSE(repository.exists("u-2"));
    EXPECT_FALSE(repository.exists("u-3"));
    EXPECT_EQ(repository.save_attempts, 2);
}

TEST_F(InMemoryRepositoryTest, RemoveRange_ShouldStopAtTheFirstMissingAggregate) {
    // Given two stored users and one that was never saved
    auto first = seed_user(users, "u-1", "alice");
    User missing("u-2");
    auto third = seed_user(users, "u-3", "carol");

    // When I remove all three as a range
    EXPECT_THROW(users.remove_range({first, missing, third}), NotFoundError);

    // Then removal stopped at the missing one
    EXPECT_FALSE(users.exists("u-1"));
    EXPECT_TRUE(users.exists("u-3"));
}
