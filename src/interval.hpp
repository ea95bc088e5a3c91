#pragma once

#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <tl/expected.hpp>

#include "checked.value.hpp"
#include "error.hpp"

/// Interval bound whose value is known at compile time.
template <typename T, T Value, typename Policy = AbortPolicy> struct StaticBound {
    using checked_type = CheckedValue<T, Policy>;
    static constexpr T value = Value;
};

template <typename B> struct BoundTraits {
    static_assert(CheckedType<B>, "interval bounds are CheckedValue or StaticBound types");

    using checked_type = B;
    static constexpr bool kIsStatic = false;
};

template <typename T, T Value, typename Policy> struct BoundTraits<StaticBound<T, Value, Policy>> {
    using checked_type = CheckedValue<T, Policy>;
    static constexpr bool kIsStatic = true;
    static constexpr T kValue = Value;
};

template <typename T> constexpr bool at_least_zero(const T v) noexcept {
    if constexpr (std::integral<T>) {
        return std::cmp_greater_equal(v, 0);
    } else {
        return v >= T{0};
    }
}

template <typename T> constexpr bool at_most_one(const T v) noexcept {
    if constexpr (std::integral<T>) {
        return std::cmp_less_equal(v, 1);
    } else {
        return v <= T{1};
    }
}

[[noreturn]] void interval_invariant_failure(const std::string_view start, const std::string_view end);

/// Closed range [start, end] of checked values. start <= end holds after every constructor and every mutating
/// operator, a violation ends the process whatever the bound policies are.
///
/// Each bound is either a CheckedValue type (value chosen at run time) or a StaticBound. With two static bounds
/// inside [0, 1] the interval is a unit interval at compile time and multiplication scales the raw bound payloads;
/// dynamic intervals make the same decision at run time.
template <typename LowerB, typename UpperB> class Interval {
public:
    using LB = typename BoundTraits<LowerB>::checked_type;
    using UB = typename BoundTraits<UpperB>::checked_type;

    static constexpr bool kHasStaticBounds = BoundTraits<LowerB>::kIsStatic && BoundTraits<UpperB>::kIsStatic;

    // Both bounds static and their values inside [0, 1]: multiplication takes the raw payload path, decided at
    // compile time.
    static constexpr bool kIsStaticUnitInterval = []() {
        if constexpr (kHasStaticBounds) {
            return at_least_zero(BoundTraits<LowerB>::kValue) && at_most_one(BoundTraits<UpperB>::kValue);
        } else {
            return false;
        }
    }();

    Interval()
        requires kHasStaticBounds
        : _start{BoundTraits<LowerB>::kValue}, _end{BoundTraits<UpperB>::kValue} {
        check_invariant();
    }

    template <typename L, typename U>
        requires CheckedOperand<L> && CheckedOperand<U>
    Interval(const L& lb, const U& ub) : _start{lb}, _end{ub} {
        check_invariant();
    }

    Interval(const Interval& rhs) : _start{rhs._start}, _end{rhs._end} { check_invariant(); }

    Interval& operator=(const Interval& rhs) {
        _start = rhs._start;
        _end = rhs._end;
        check_invariant();
        return *this;
    }

    /// Same as the two bound constructor, but an empty range is returned as an error instead of ending the process.
    template <typename L, typename U>
        requires CheckedOperand<L> && CheckedOperand<U>
    static tl::expected<Interval, IntervalError> create(const L& lb, const U& ub) {
        const LB start{lb};
        const UB end{ub};
        if (!(start <= end)) {
            return tl::make_unexpected(IntervalError{fmt::format("{}", start), fmt::format("{}", end)});
        }
        return Interval{start, end};
    }

    const LB& start() const noexcept { return _start; }
    const UB& end() const noexcept { return _end; }

    // Current bounds inside [0, 1]. The type level kIsStaticUnitInterval only describes where a static interval
    // starts out, arithmetic may move it away.
    bool is_unit_interval() const { return _start >= 0 && _end <= 1; }

    auto size() const { return _end - _start; }

    template <typename V>
        requires CheckedOperand<V>
    bool contains(const V& x) const {
        return _start <= x && _end >= x;
    }

    template <typename V>
        requires CheckedOperand<V>
    bool surrounds(const V& x) const {
        return _start < x && _end > x;
    }

    template <typename V>
        requires CheckedOperand<V>
    LB clamp(const V& x) const {
        if (_start > x)
            return _start;
        if (_end < x)
            return LB{_end, _start.domain()};
        return LB{x, _start.domain()};
    }

    template <typename L2, typename U2> bool operator==(const Interval<L2, U2>& rhs) const {
        return _start == rhs.start() && _end == rhs.end();
    }

    template <NumericDomainType Rhs> Interval operator+(const Rhs rhs) const { return apply<ArithOp::Add>(rhs); }
    template <NumericDomainType Rhs> Interval operator-(const Rhs rhs) const { return apply<ArithOp::Sub>(rhs); }
    template <NumericDomainType Rhs> Interval operator*(const Rhs rhs) const { return apply<ArithOp::Mul>(rhs); }
    template <NumericDomainType Rhs> Interval operator/(const Rhs rhs) const { return apply<ArithOp::Div>(rhs); }
    template <NumericDomainType Rhs> Interval operator%(const Rhs rhs) const { return apply<ArithOp::Mod>(rhs); }

    template <NumericDomainType Rhs> Interval& operator+=(const Rhs rhs) { return apply_assign<ArithOp::Add>(rhs); }
    template <NumericDomainType Rhs> Interval& operator-=(const Rhs rhs) { return apply_assign<ArithOp::Sub>(rhs); }
    template <NumericDomainType Rhs> Interval& operator*=(const Rhs rhs) { return apply_assign<ArithOp::Mul>(rhs); }
    template <NumericDomainType Rhs> Interval& operator/=(const Rhs rhs) { return apply_assign<ArithOp::Div>(rhs); }
    template <NumericDomainType Rhs> Interval& operator%=(const Rhs rhs) { return apply_assign<ArithOp::Mod>(rhs); }

private:
    template <ArithOp op, typename Rhs> Interval apply(const Rhs rhs) const {
        Interval result{*this};
        result.template apply_assign<op>(rhs);
        return result;
    }

    // No reordering of the bounds: an operator that swaps them (multiplying by a negative scalar) fails the
    // invariant check.
    template <ArithOp op, typename Rhs> Interval& apply_assign(const Rhs rhs) {
        if constexpr (op == ArithOp::Mul && kIsStaticUnitInterval) {
            scale_unit_bounds(rhs);
        } else if constexpr (op == ArithOp::Mul && !kHasStaticBounds) {
            if (is_unit_interval()) {
                scale_unit_bounds(rhs);
            } else {
                _start = checked_binary<op>(_start, rhs);
                _end = checked_binary<op>(_end, rhs);
            }
        } else {
            _start = checked_binary<op>(_start, rhs);
            _end = checked_binary<op>(_end, rhs);
        }

        check_invariant();
        return *this;
    }

    template <typename Rhs> void scale_unit_bounds(const Rhs rhs) {
        _start = scale_raw(_start, rhs);
        _end = scale_raw(_end, rhs);
    }

    // Multiplies the raw payload and converts the product back into the bound type.
    template <typename Bound, typename Rhs> static Bound scale_raw(const Bound& bound, const Rhs rhs) {
        using Policy = typename Bound::policy_type;
        const auto raw = bound.get();
        bool overflow{false};
        const auto product = op_checked<ArithOp::Mul>(raw, rhs, overflow);
        return Bound{overflow ? Policy::template on_overflow<ArithOp::Mul>(raw, rhs) : product, bound.domain()};
    }

    void check_invariant() const {
        if (!(_start <= _end)) {
            interval_invariant_failure(fmt::format("{}", _start), fmt::format("{}", _end));
        }
    }

    LB _start;
    UB _end;
};

template <typename T, typename Policy = AbortPolicy>
using UnitInterval = Interval<StaticBound<T, T{0}, Policy>, StaticBound<T, T{1}, Policy>>;

template <typename LowerB, typename UpperB>
struct fmt::formatter<Interval<LowerB, UpperB>> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(const Interval<LowerB, UpperB>& i, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "[{}, {}]", i.start(), i.end());
    }
};
