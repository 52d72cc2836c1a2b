#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "aggregate.hpp"
#include "errors.hpp"
#include "helpers.hpp"

namespace ddd {

/**
 * "type#id" for an aggregate type declared with DDD_AGGREGATE.
 */
template<typename T>
std::string aggregate_key(const typename T::Id& id) {
    return std::string(T::kAggregateType) + "#" + helpers::id_to_string(id);
}

/**
 * ConflictError for an aggregate whose store holds version actual.
 */
inline ConflictError version_conflict(const AggregateRoot& aggregate, std::uint64_t actual) {
    return ConflictError(aggregate.key() + " was modified concurrently: expected version " +
                             std::to_string(aggregate.persisted_version()) + ", found " +
                             std::to_string(actual),
                         aggregate.persisted_version(), actual);
}

/**
 * Read side of a repository: snapshot lookups by id and paging.
 *
 * Snapshots are returned by value; a loaded aggregate has no pending events
 * and its persisted_version() equals its version().
 */
template<typename T>
class ReadRepository {
public:
    static_assert(std::is_base_of_v<AggregateRoot, T>, "T must derive from AggregateRoot");

    using Id = typename T::Id;

    virtual ~ReadRepository() = default;

    /**
     * Snapshot for id, or nullopt if none is persisted.
     */
    virtual std::optional<T> find(const Id& id) const = 0;

    /**
     * Up to take snapshots in id order, after skipping skip of them.
     */
    virtual std::vector<T> list(std::size_t skip, std::size_t take) const = 0;

    /**
     * Number of persisted aggregates.
     */
    virtual std::size_t count() const = 0;

    /**
     * Current persisted snapshot for id.
     *
     * @throws NotFoundError if nothing is persisted under id
     */
    virtual T load(const Id& id) const {
        auto found = find(id);
        if (!found) {
            throw NotFoundError(aggregate_key<T>(id) + " not found");
        }
        return std::move(*found);
    }

    bool exists(const Id& id) const { return find(id).has_value(); }

    bool is_empty() const { return count() == 0; }
};

/**
 * Persistence capability for one aggregate type, with optimistic
 * concurrency.
 *
 * save() must fail with ConflictError when the stored version differs from
 * aggregate.persisted_version() (no stored entry counts as version 0).
 * Storage technology is the implementer's concern; stores without
 * conditional writes emulate the comparison here.
 */
template<typename T>
class Repository : public ReadRepository<T> {
public:
    using typename ReadRepository<T>::Id;

    /**
     * Persist the full state of aggregate.
     *
     * Does not touch the aggregate itself: callers mark it persisted once
     * the save has returned.
     *
     * @throws ConflictError on a version mismatch
     */
    virtual void save(const T& aggregate) = 0;

    /**
     * Delete the persisted aggregate.
     *
     * @throws NotFoundError if nothing is persisted under its id
     * @throws ConflictError on a version mismatch
     */
    virtual void remove(const T& aggregate) = 0;

    /**
     * Save each aggregate in order, stopping at the first failure.
     *
     * Not atomic: aggregates before the failing one stay saved.
     */
    virtual void save_range(const std::vector<T>& aggregates) {
        for (const auto& aggregate : aggregates) {
            save(aggregate);
        }
    }

    /**
     * Remove each aggregate in order, stopping at the first failure.
     */
    virtual void remove_range(const std::vector<T>& aggregates) {
        for (const auto& aggregate : aggregates) {
            remove(aggregate);
        }
    }

    /**
     * Side-effect-free version comparison, used before a commit writes
     * anything.
     *
     * @throws ConflictError if save(aggregate) would conflict now
     */
    virtual void check(const T& aggregate) const {
        auto current = this->find(aggregate.id());
        std::uint64_t actual = current ? current->version() : 0;
        if (actual != aggregate.persisted_version()) {
            throw version_conflict(aggregate, actual);
        }
    }
};

} // namespace ddd
