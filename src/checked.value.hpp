#pragma once

#include <compare>
#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "checked.domain.hpp"
#include "checked.ops.hpp"
#include "checked.policy.hpp"

template <typename T, typename Policy = AbortPolicy> class CheckedValue;

template <typename V> struct IsCheckedValue : std::false_type {};
template <typename T, typename Policy> struct IsCheckedValue<CheckedValue<T, Policy>> : std::true_type {};

template <typename V>
concept CheckedType = IsCheckedValue<std::remove_cvref_t<V>>::value;

template <typename V>
concept CheckedOperand = CheckedType<V> || NumericDomainType<std::remove_cvref_t<V>>;

template <typename V> constexpr auto raw_value(const V& v) noexcept {
    if constexpr (CheckedType<V>) {
        return v.get();
    } else {
        return v;
    }
}

template <typename V> using RawType = std::remove_cvref_t<decltype(raw_value(std::declval<const V&>()))>;

/// A number of type `T` confined to a BoundedDomain. Conversions, arithmetic and comparisons are checked, anything
/// unsafe is handed to `Policy` before the stored value changes or a comparison answers.
///
/// The domain is referenced, not copied, it has to outlive every value using it.
template <typename T, typename Policy> class CheckedValue {
    static_assert(NumericDomainType<T>, "checked values wrap built-in integer or floating point types");
    static_assert(CheckedPolicy<Policy>, "Policy does not provide the checked value hooks");

public:
    using value_type = T;
    using policy_type = Policy;
    using domain_type = BoundedDomain<T>;

    constexpr CheckedValue() noexcept = default;
    constexpr CheckedValue(const CheckedValue&) noexcept = default;

    template <typename V>
        requires CheckedOperand<V>
    constexpr explicit CheckedValue(const V& value, const domain_type& domain = kNaturalDomain<T>)
        : _value{admit(raw_value(value), domain)}, _domain{&domain} {}

    template <typename V>
        requires CheckedOperand<V>
    CheckedValue(const V& value, const domain_type&& domain) = delete;

    // Assignment keeps the domain of the target.
    constexpr CheckedValue& operator=(const CheckedValue& rhs) {
        _value = admit(rhs._value, *_domain);
        return *this;
    }

    template <typename V>
        requires CheckedOperand<V>
    constexpr CheckedValue& operator=(const V& rhs) {
        _value = admit(raw_value(rhs), *_domain);
        return *this;
    }

    [[nodiscard]] constexpr T get() const noexcept { return _value; }
    constexpr const domain_type& domain() const noexcept { return *_domain; }

    constexpr auto operator-() const {
        using R = NegateResult<T>;
        bool overflow{false};
        const R result = op_checked<ArithOp::Negate>(_value, overflow);
        const R value = overflow ? Policy::template on_overflow<ArithOp::Negate>(_value) : result;
        if constexpr (std::is_same_v<R, T>) {
            return CheckedValue<R, Policy>{value, *_domain};
        } else {
            return CheckedValue<R, Policy>{value};
        }
    }

    template <typename V>
        requires CheckedOperand<V>
    constexpr CheckedValue& operator+=(const V& rhs);
    template <typename V>
        requires CheckedOperand<V>
    constexpr CheckedValue& operator-=(const V& rhs);
    template <typename V>
        requires CheckedOperand<V>
    constexpr CheckedValue& operator*=(const V& rhs);
    template <typename V>
        requires CheckedOperand<V>
    constexpr CheckedValue& operator/=(const V& rhs);
    template <typename V>
        requires CheckedOperand<V>
    constexpr CheckedValue& operator%=(const V& rhs);

    template <typename V>
        requires CheckedOperand<V>
    constexpr bool operator==(const V& rhs) const {
        return Policy::hook_op_equals(_value, raw_value(rhs));
    }

    // Partial ordering as soon as a floating point operand is involved, NaN is unordered.
    template <typename V>
        requires CheckedOperand<V>
    constexpr auto operator<=>(const V& rhs) const {
        const auto other = raw_value(rhs);
        const int result = Policy::hook_op_cmp(_value, other, "<=>");
        if constexpr (std::floating_point<T> || std::floating_point<RawType<V>>) {
            if (is_nan(_value) || is_nan(other))
                return std::partial_ordering::unordered;
            return static_cast<std::partial_ordering>(result <=> 0);
        } else {
            return result <=> 0;
        }
    }

private:
    template <typename U> static constexpr T admit(const U raw, const domain_type& domain) {
        T converted{};
        if constexpr (std::is_same_v<U, T>) {
            converted = raw;
        } else {
            converted = cast_preserves_value<T>(raw) ? static_cast<T>(raw) : Policy::template on_bad_cast<T>(raw);
        }

        if (converted < domain.min)
            return Policy::on_lower_bound(converted, domain.min);
        if (domain.max < converted)
            return Policy::on_upper_bound(converted, domain.max);
        return converted;
    }

    T _value{};
    const domain_type* _domain{&kNaturalDomain<T>};
};

template <typename Lhs, typename Rhs> constexpr const auto& checked_carrier(const Lhs& lhs, const Rhs& rhs) noexcept {
    if constexpr (CheckedType<Lhs>) {
        return lhs;
    } else {
        return rhs;
    }
}

/// `lhs op rhs` with at least one checked operand. The policy and, when the promoted result type is unchanged,
/// the domain come from the checked operand (the left one if both are).
template <ArithOp op, typename Lhs, typename Rhs>
    requires CheckedOperand<Lhs> && CheckedOperand<Rhs> && (CheckedType<Lhs> || CheckedType<Rhs>)
constexpr auto checked_binary(const Lhs& lhs, const Rhs& rhs) {
    using Carrier = std::remove_cvref_t<decltype(checked_carrier(lhs, rhs))>;
    using Policy = typename Carrier::policy_type;
    using R = ArithResult<RawType<Lhs>, RawType<Rhs>>;

    const auto a = raw_value(lhs);
    const auto b = raw_value(rhs);
    bool overflow{false};
    const R result = op_checked<op>(a, b, overflow);
    const R value = overflow ? Policy::template on_overflow<op>(a, b) : result;

    if constexpr (std::is_same_v<R, typename Carrier::value_type>) {
        return CheckedValue<R, Policy>{value, checked_carrier(lhs, rhs).domain()};
    } else {
        return CheckedValue<R, Policy>{value};
    }
}

/// Ordering through the policy of the checked operand (the left one if both are), which is told the operator used.
/// Comparisons with NaN are false.
template <typename Lhs, typename Rhs>
    requires CheckedOperand<Lhs> && CheckedOperand<Rhs> && (CheckedType<Lhs> || CheckedType<Rhs>)
constexpr int checked_ordering(const std::string_view op, const Lhs& lhs, const Rhs& rhs, bool& unordered) {
    using Policy = typename std::remove_cvref_t<decltype(checked_carrier(lhs, rhs))>::policy_type;

    const auto a = raw_value(lhs);
    const auto b = raw_value(rhs);
    const int result = Policy::hook_op_cmp(a, b, op);
    unordered = is_nan(a) || is_nan(b);
    return result;
}

#define CHECKED_ORDERING_OPERATOR(sym)                                                                                 \
    template <typename Lhs, typename Rhs>                                                                              \
        requires CheckedOperand<Lhs> && CheckedOperand<Rhs> && (CheckedType<Lhs> || CheckedType<Rhs>)                  \
    constexpr bool operator sym(const Lhs& lhs, const Rhs& rhs) {                                                      \
        bool unordered{false};                                                                                         \
        const int result = checked_ordering(#sym, lhs, rhs, unordered);                                                \
        return !unordered && result sym 0;                                                                             \
    }

CHECKED_ORDERING_OPERATOR(<)
CHECKED_ORDERING_OPERATOR(<=)
CHECKED_ORDERING_OPERATOR(>)
CHECKED_ORDERING_OPERATOR(>=)

#undef CHECKED_ORDERING_OPERATOR

#define CHECKED_BINARY_OPERATOR(sym, op)                                                                               \
    template <typename Lhs, typename Rhs>                                                                              \
        requires CheckedOperand<Lhs> && CheckedOperand<Rhs> && (CheckedType<Lhs> || CheckedType<Rhs>)                  \
    constexpr auto operator sym(const Lhs& lhs, const Rhs& rhs) {                                                      \
        return checked_binary<op>(lhs, rhs);                                                                           \
    }

CHECKED_BINARY_OPERATOR(+, ArithOp::Add)
CHECKED_BINARY_OPERATOR(-, ArithOp::Sub)
CHECKED_BINARY_OPERATOR(*, ArithOp::Mul)
CHECKED_BINARY_OPERATOR(/, ArithOp::Div)
CHECKED_BINARY_OPERATOR(%, ArithOp::Mod)

#undef CHECKED_BINARY_OPERATOR

template <typename T, typename Policy>
template <typename V>
    requires CheckedOperand<V>
constexpr CheckedValue<T, Policy>& CheckedValue<T, Policy>::operator+=(const V& rhs) {
    return *this = checked_binary<ArithOp::Add>(*this, rhs);
}

template <typename T, typename Policy>
template <typename V>
    requires CheckedOperand<V>
constexpr CheckedValue<T, Policy>& CheckedValue<T, Policy>::operator-=(const V& rhs) {
    return *this = checked_binary<ArithOp::Sub>(*this, rhs);
}

template <typename T, typename Policy>
template <typename V>
    requires CheckedOperand<V>
constexpr CheckedValue<T, Policy>& CheckedValue<T, Policy>::operator*=(const V& rhs) {
    return *this = checked_binary<ArithOp::Mul>(*this, rhs);
}

template <typename T, typename Policy>
template <typename V>
    requires CheckedOperand<V>
constexpr CheckedValue<T, Policy>& CheckedValue<T, Policy>::operator/=(const V& rhs) {
    return *this = checked_binary<ArithOp::Div>(*this, rhs);
}

template <typename T, typename Policy>
template <typename V>
    requires CheckedOperand<V>
constexpr CheckedValue<T, Policy>& CheckedValue<T, Policy>::operator%=(const V& rhs) {
    return *this = checked_binary<ArithOp::Mod>(*this, rhs);
}

template <typename T, typename Policy> struct fmt::formatter<CheckedValue<T, Policy>> : fmt::formatter<T> {
    template <typename FormatContext> auto format(const CheckedValue<T, Policy>& v, FormatContext& ctx) const {
        return fmt::formatter<T>::format(v.get(), ctx);
    }
};
