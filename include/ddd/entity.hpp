#pragma once

#include <chrono>
#include <string>
#include <utility>
#include "helpers.hpp"

namespace ddd {

/**
 * Base class for objects defined by a thread of identity rather than by
 * their attributes.
 *
 * Two entities are equal when their ids are equal, whatever the rest of
 * their state.
 *
 * Usage:
 *   class Account : public Entity<std::string> {
 *   public:
 *       explicit Account(std::string id) : Entity(std::move(id)) {}
 *   };
 */
template<typename IdT>
class Entity {
public:
    using Id = IdT;
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Entity() = default;

    const Id& id() const { return id_; }

    /**
     * Id rendered as a string, for keys and logs.
     */
    std::string id_string() const { return helpers::id_to_string(id_); }

    TimePoint created_at() const { return created_at_; }
    TimePoint updated_at() const { return updated_at_; }

    friend bool operator==(const Entity& lhs, const Entity& rhs) { return lhs.id_ == rhs.id_; }
    friend bool operator!=(const Entity& lhs, const Entity& rhs) { return !(lhs == rhs); }

protected:
    explicit Entity(Id id)
        : id_(std::move(id)),
          created_at_(std::chrono::system_clock::now()),
          updated_at_(created_at_) {}

    Entity(Id id, TimePoint created_at, TimePoint updated_at)
        : id_(std::move(id)), created_at_(created_at), updated_at_(updated_at) {}

    Entity(const Entity&) = default;
    Entity& operator=(const Entity&) = default;
    Entity(Entity&&) = default;
    Entity& operator=(Entity&&) = default;

    /**
     * Record that the entity changed now.
     */
    void touch() { updated_at_ = std::chrono::system_clock::now(); }

private:
    Id id_;
    TimePoint created_at_;
    TimePoint updated_at_;
};

} // namespace ddd
