#pragma once

namespace ddd {

/**
 * CRTP base for immutable, identity-less types compared by value.
 *
 * Derived types list the members taking part in equality:
 *
 *   class Money : public ValueObject<Money> {
 *   public:
 *       Money(std::int64_t cents, std::string currency)
 *           : cents_(cents), currency_(std::move(currency)) {}
 *
 *       auto equality_components() const { return std::tie(cents_, currency_); }
 *
 *   private:
 *       std::int64_t cents_;
 *       std::string currency_;
 *   };
 *
 * Members left out of equality_components() do not affect comparison.
 */
template<typename Derived>
class ValueObject {
public:
    friend bool operator==(const Derived& lhs, const Derived& rhs) {
        return lhs.equality_components() == rhs.equality_components();
    }

    friend bool operator!=(const Derived& lhs, const Derived& rhs) {
        return !(lhs == rhs);
    }

    friend bool operator<(const Derived& lhs, const Derived& rhs) {
        return lhs.equality_components() < rhs.equality_components();
    }

protected:
    ValueObject() = default;
    ~ValueObject() = default;
};

} // namespace ddd
