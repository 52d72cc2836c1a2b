#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "errors.hpp"
#include "logging.hpp"
#include "repository.hpp"

namespace ddd {

/**
 * Repository holding snapshot copies in memory, keyed by id.
 *
 * Version comparison and write happen under one exclusive lock, which is
 * how a store without conditional writes provides optimistic concurrency.
 * Safe for concurrent use.
 *
 * Example:
 *   InMemoryRepository<User> users;
 *   User user("u-1");
 *   user.rename("alice");
 *   users.save(user);
 *   auto loaded = users.load("u-1");
 */
template<typename T>
class InMemoryRepository : public Repository<T> {
public:
    using typename Repository<T>::Id;

    std::optional<T> find(const Id& id) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<T> list(std::size_t skip, std::size_t take) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<T> page;
        std::size_t index = 0;
        for (const auto& [id, snapshot] : entries_) {
            if (page.size() >= take) break;
            if (index++ < skip) continue;
            page.push_back(snapshot);
        }
        return page;
    }

    std::size_t count() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    void save(const T& aggregate) override {
        T snapshot = aggregate;
        AggregateRoot& stored = snapshot;
        stored.discard_events();
        stored.mark_persisted();

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(aggregate.id());
        require_version(aggregate, it == entries_.end() ? 0 : it->second.version());

        if (it == entries_.end()) {
            entries_.emplace(aggregate.id(), std::move(snapshot));
        } else {
            it->second = std::move(snapshot);
        }
        lock.unlock();

        ++save_count_;
        log_debug("repository", "aggregate_saved",
                  {{"aggregate", aggregate.key()}, {"version", aggregate.version()}});
    }

    void remove(const T& aggregate) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(aggregate.id());
        if (it == entries_.end()) {
            throw NotFoundError(aggregate.key() + " not found");
        }
        require_version(aggregate, it->second.version());
        entries_.erase(it);
        lock.unlock();

        log_debug("repository", "aggregate_removed", {{"aggregate", aggregate.key()}});
    }

    void check(const T& aggregate) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(aggregate.id());
        require_version(aggregate, it == entries_.end() ? 0 : it->second.version());
    }

    /**
     * Successful saves since construction.
     */
    std::size_t save_count() const { return save_count_.load(); }

private:
    static void require_version(const T& aggregate, std::uint64_t actual) {
        if (actual != aggregate.persisted_version()) {
            throw version_conflict(aggregate, actual);
        }
    }

    mutable std::shared_mutex mutex_;
    std::map<Id, T> entries_;
    std::atomic<std::size_t> save_count_{0};
};

} // namespace ddd
