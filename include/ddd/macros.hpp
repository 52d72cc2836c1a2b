#pragma once

#include <string>

/**
 * Declare this class as an aggregate with the given type name.
 * Must be in public section of class.
 *
 * Usage:
 *   class User : public ddd::Aggregate<std::string, UserState> {
 *   public:
 *       DDD_AGGREGATE("user")
 *       ...
 *   };
 */
#define DDD_AGGREGATE(type_name) \
    static constexpr const char* kAggregateType = type_name; \
    std::string aggregate_type() const override { return kAggregateType; }
