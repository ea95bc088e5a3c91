#pragma once

#include <bit>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>
#include <utility>

enum class ArithOp : uint8_t {
    Negate,
    Add,
    Sub,
    Mul,
    Div,
    Mod,
};

constexpr std::string_view arith_op_symbol(const ArithOp op) noexcept {
    switch (op) {
    case ArithOp::Negate:
    case ArithOp::Sub:
        return "-";
    case ArithOp::Add:
        return "+";
    case ArithOp::Mul:
        return "*";
    case ArithOp::Div:
        return "/";
    case ArithOp::Mod:
        return "%";
    }
    return "?";
}

template <typename T>
inline constexpr bool kIsCharacterType =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> || std::is_same_v<T, char8_t> ||
    std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

// Built-in integers (except bool and the character kinds) and floating point types.
template <typename T>
concept NumericDomainType =
    std::same_as<T, std::remove_cv_t<T>> &&
    ((std::integral<T> && !std::is_same_v<T, bool> && !kIsCharacterType<T>) || std::floating_point<T>);

template <typename Lhs, typename Rhs>
using ArithResult = decltype(std::declval<Lhs>() + std::declval<Rhs>());

template <typename Lhs>
using NegateResult = decltype(-std::declval<Lhs>());

template <typename T> constexpr std::string_view numeric_type_name() noexcept {
    if constexpr (std::floating_point<T>) {
        if constexpr (std::is_same_v<T, float>) {
            return "f32";
        } else if constexpr (std::is_same_v<T, double>) {
            return "f64";
        } else {
            return "long double";
        }
    } else if constexpr (std::is_signed_v<T>) {
        constexpr std::string_view names[] = {"i8", "i16", "?", "i32", "?", "?", "?", "i64"};
        return names[sizeof(T) - 1];
    } else {
        constexpr std::string_view names[] = {"u8", "u16", "?", "u32", "?", "?", "?", "u64"};
        return names[sizeof(T) - 1];
    }
}

template <typename T> constexpr bool is_negative(const T value) noexcept {
    if constexpr (std::is_signed_v<T>) {
        return value < T{0};
    } else {
        return false;
    }
}

template <typename T> constexpr bool is_nan(const T value) noexcept {
    if constexpr (std::floating_point<T>) {
        return value != value;
    } else {
        return false;
    }
}

template <typename T> bool is_finite(const T value) noexcept {
    if constexpr (std::floating_point<T>) {
        return std::isfinite(value);
    } else {
        return true;
    }
}

// First value past the top of an integral type, as a floating point number (exact, a power of two).
template <std::integral Dst, std::floating_point Src> constexpr Src integral_upper_limit() noexcept {
    return static_cast<Src>(uintmax_t{1} << (std::numeric_limits<Dst>::digits - 1)) * Src{2};
}

// Exact three way comparison of an integer with a real that is not NaN. Neither operand is converted to the
// other's type.
template <std::integral I, std::floating_point F> constexpr int cmp_integral_real(const I i, const F f) noexcept {
    if (f >= integral_upper_limit<I, F>())
        return -1;
    if (f < static_cast<F>(std::numeric_limits<I>::min()))
        return 1;

    const F whole = std::trunc(f);
    const I truncated = static_cast<I>(whole);
    if (i != truncated)
        return i < truncated ? -1 : 1;

    const F fraction = f - whole;
    return fraction > F{0} ? -1 : (fraction < F{0} ? 1 : 0);
}

// A negative signed integer met by an unsigned integer, whatever the widths.
template <typename Lhs, typename Rhs> constexpr bool sign_mismatch(const Lhs lhs, const Rhs rhs) noexcept {
    if constexpr (std::integral<Lhs> && std::integral<Rhs>) {
        if constexpr (std::is_signed_v<Lhs> && std::is_unsigned_v<Rhs>) {
            return lhs < Lhs{0};
        } else if constexpr (std::is_unsigned_v<Lhs> && std::is_signed_v<Rhs>) {
            return rhs < Rhs{0};
        } else {
            return false;
        }
    } else {
        return false;
    }
}

/// Equality that never lets a negative signed value alias a large unsigned one. The result is always
/// mathematically correct, `error` reports whether the comparison mixed a negative signed operand with an
/// unsigned one.
template <typename Lhs, typename Rhs>
constexpr bool checked_equals(const Lhs lhs, const Rhs rhs, bool& error) noexcept {
    error = sign_mismatch(lhs, rhs);
    if constexpr (std::integral<Lhs> && std::integral<Rhs>) {
        return std::cmp_equal(lhs, rhs);
    } else if constexpr (std::integral<Lhs>) {
        return !is_nan(rhs) && cmp_integral_real(lhs, rhs) == 0;
    } else if constexpr (std::integral<Rhs>) {
        return !is_nan(lhs) && cmp_integral_real(rhs, lhs) == 0;
    } else {
        return lhs == rhs;
    }
}

/// Three way comparison (negative, zero, positive) with the same sign rules as `checked_equals`. Unordered
/// floating point operands also raise `error`.
template <typename Lhs, typename Rhs>
constexpr int checked_cmp(const Lhs lhs, const Rhs rhs, bool& error) noexcept {
    if constexpr (std::integral<Lhs> && std::integral<Rhs>) {
        error = sign_mismatch(lhs, rhs);
        if (std::cmp_less(lhs, rhs))
            return -1;
        return std::cmp_equal(lhs, rhs) ? 0 : 1;
    } else {
        error = is_nan(lhs) || is_nan(rhs);
        if (error)
            return 0;
        if constexpr (std::integral<Lhs>) {
            return cmp_integral_real(lhs, rhs);
        } else if constexpr (std::integral<Rhs>) {
            return -cmp_integral_real(rhs, lhs);
        } else {
            return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
        }
    }
}

template <ArithOp op, typename R, typename Lhs, typename Rhs>
constexpr R divide_checked(const Lhs lhs, const Rhs rhs, bool& overflow) noexcept {
    static_assert(op == ArithOp::Div || op == ArithOp::Mod);

    if (rhs == Rhs{0}) {
        overflow = true;
        return R{0};
    }

    if constexpr (std::is_signed_v<R>) {
        //
        // a signed common type holds both operands
        const R a = static_cast<R>(lhs);
        const R b = static_cast<R>(rhs);
        if (b == R{-1} && a == std::numeric_limits<R>::min()) {
            overflow = op == ArithOp::Div;
            return op == ArithOp::Div ? a : R{0};
        }
        return op == ArithOp::Div ? a / b : a % b;
    } else {
        //
        // unsigned common type, at most one operand is negative
        const bool lhs_negative = is_negative(lhs);
        const bool rhs_negative = is_negative(rhs);
        const R a = lhs_negative ? static_cast<R>(R{0} - static_cast<R>(lhs)) : static_cast<R>(lhs);
        const R b = rhs_negative ? static_cast<R>(R{0} - static_cast<R>(rhs)) : static_cast<R>(rhs);
        const R magnitude = op == ArithOp::Div ? a / b : a % b;
        const bool negative_result = op == ArithOp::Div ? lhs_negative != rhs_negative : lhs_negative;

        if (negative_result && magnitude != R{0}) {
            overflow = true;
            return static_cast<R>(R{0} - magnitude);
        }
        return magnitude;
    }
}

/// Unary operator. Returns the wrapped result, `overflow` tells if it differs from the true one.
template <ArithOp op, typename Lhs>
    requires(op == ArithOp::Negate)
constexpr NegateResult<Lhs> op_checked(const Lhs lhs, bool& overflow) noexcept {
    using R = NegateResult<Lhs>;
    if constexpr (std::floating_point<R>) {
        overflow = false;
        return -lhs;
    } else {
        R result{};
        overflow = __builtin_sub_overflow(R{0}, lhs, &result);
        return result;
    }
}

/// Binary operator evaluated in the promoted common type `R` of the operands (what `lhs op rhs` would give).
/// Returns the wrapped result and raises `overflow` when the mathematically correct value does not fit `R`.
template <ArithOp op, typename Lhs, typename Rhs>
    requires(op != ArithOp::Negate)
constexpr ArithResult<Lhs, Rhs> op_checked(const Lhs lhs, const Rhs rhs, bool& overflow) noexcept {
    using R = ArithResult<Lhs, Rhs>;
    overflow = false;

    if constexpr (std::floating_point<R>) {
        const R a = static_cast<R>(lhs);
        const R b = static_cast<R>(rhs);
        R result{};
        if constexpr (op == ArithOp::Add) {
            result = a + b;
        } else if constexpr (op == ArithOp::Sub) {
            result = a - b;
        } else if constexpr (op == ArithOp::Mul) {
            result = a * b;
        } else if constexpr (op == ArithOp::Div) {
            result = a / b;
        } else {
            result = std::fmod(a, b);
        }
        overflow = !is_finite(result) && is_finite(a) && is_finite(b);
        return result;
    } else {
        R result{};
        if constexpr (op == ArithOp::Add) {
            overflow = __builtin_add_overflow(lhs, rhs, &result);
        } else if constexpr (op == ArithOp::Sub) {
            overflow = __builtin_sub_overflow(lhs, rhs, &result);
        } else if constexpr (op == ArithOp::Mul) {
            overflow = __builtin_mul_overflow(lhs, rhs, &result);
        } else {
            result = divide_checked<op, R>(lhs, rhs, overflow);
        }
        return result;
    }
}

template <ArithOp op, typename Lhs> constexpr NegateResult<Lhs> wrapped_result(const Lhs lhs) noexcept {
    bool overflow{false};
    return op_checked<op>(lhs, overflow);
}

template <ArithOp op, typename Lhs, typename Rhs>
constexpr ArithResult<Lhs, Rhs> wrapped_result(const Lhs lhs, const Rhs rhs) noexcept {
    bool overflow{false};
    return op_checked<op>(lhs, rhs, overflow);
}

/// True iff `static_cast<Dst>(src)` keeps the exact value of `src`: no truncation, no lost precision, no negative
/// value turned unsigned.
template <typename Dst, typename Src> bool cast_preserves_value(const Src src) noexcept {
    if constexpr (std::integral<Dst> && std::integral<Src>) {
        return std::in_range<Dst>(src);
    } else if constexpr (std::integral<Dst>) {
        if (is_nan(src))
            return false;
        if (src < static_cast<Src>(std::numeric_limits<Dst>::min()) || src >= integral_upper_limit<Dst, Src>())
            return false;
        return static_cast<Src>(static_cast<Dst>(src)) == src;
    } else if constexpr (std::integral<Src>) {
        const uintmax_t magnitude =
            is_negative(src) ? uintmax_t{0} - static_cast<uintmax_t>(src) : static_cast<uintmax_t>(src);
        if (magnitude == 0)
            return true;
        const int significant_bits = static_cast<int>(std::bit_width(magnitude)) - std::countr_zero(magnitude);
        return significant_bits <= std::numeric_limits<Dst>::digits;
    } else {
        if (is_nan(src) || !is_finite(src))
            return true;
        if constexpr (std::numeric_limits<Dst>::digits >= std::numeric_limits<Src>::digits &&
                      std::numeric_limits<Dst>::max_exponent >= std::numeric_limits<Src>::max_exponent) {
            return true;
        } else {
            if (src > static_cast<Src>(std::numeric_limits<Dst>::max()) ||
                src < static_cast<Src>(std::numeric_limits<Dst>::lowest()))
                return false;
            return static_cast<Src>(static_cast<Dst>(src)) == src;
        }
    }
}

/// Conversion clamped to the range of `Dst`; NaN converts to 0 for integral targets.
template <typename Dst, typename Src> Dst saturating_cast(const Src src) noexcept {
    if constexpr (std::integral<Dst> && std::integral<Src>) {
        if (std::cmp_less(src, std::numeric_limits<Dst>::min()))
            return std::numeric_limits<Dst>::min();
        if (std::cmp_greater(src, std::numeric_limits<Dst>::max()))
            return std::numeric_limits<Dst>::max();
        return static_cast<Dst>(src);
    } else if constexpr (std::integral<Dst>) {
        if (is_nan(src))
            return Dst{0};
        if (src <= static_cast<Src>(std::numeric_limits<Dst>::min()))
            return std::numeric_limits<Dst>::min();
        if (src >= integral_upper_limit<Dst, Src>())
            return std::numeric_limits<Dst>::max();
        return static_cast<Dst>(src);
    } else if constexpr (std::integral<Src>) {
        return static_cast<Dst>(src);
    } else {
        if (is_nan(src))
            return std::numeric_limits<Dst>::quiet_NaN();
        if constexpr (std::numeric_limits<Dst>::max_exponent < std::numeric_limits<Src>::max_exponent) {
            if (src > static_cast<Src>(std::numeric_limits<Dst>::max()))
                return std::numeric_limits<Dst>::max();
            if (src < static_cast<Src>(std::numeric_limits<Dst>::lowest()))
                return std::numeric_limits<Dst>::lowest();
        }
        return static_cast<Dst>(src);
    }
}

/// Conversion that keeps the low order bits for integers; conversions without a modular meaning saturate.
template <typename Dst, typename Src> Dst wrapping_cast(const Src src) noexcept {
    if constexpr (std::integral<Dst> && std::integral<Src>) {
        return static_cast<Dst>(src);
    } else if constexpr (std::floating_point<Dst> && std::floating_point<Src>) {
        if (is_nan(src) || cast_preserves_value<Dst>(src))
            return static_cast<Dst>(src);
        if (src > static_cast<Src>(std::numeric_limits<Dst>::max()))
            return std::numeric_limits<Dst>::infinity();
        if (src < static_cast<Src>(std::numeric_limits<Dst>::lowest()))
            return -std::numeric_limits<Dst>::infinity();
        return static_cast<Dst>(src);
    } else {
        return saturating_cast<Dst>(src);
    }
}

/// Extreme of the result type in the direction of the true (unrepresentable) result of `op`.
template <ArithOp op, typename Lhs> constexpr NegateResult<Lhs> saturated_result(const Lhs lhs) noexcept {
    using R = NegateResult<Lhs>;
    if constexpr (std::is_signed_v<R> && std::integral<R>) {
        return std::numeric_limits<R>::max();
    } else {
        return is_negative(lhs) ? std::numeric_limits<R>::max() : std::numeric_limits<R>::lowest();
    }
}

template <ArithOp op, typename Lhs, typename Rhs>
constexpr ArithResult<Lhs, Rhs> saturated_result(const Lhs lhs, const Rhs rhs) noexcept {
    using R = ArithResult<Lhs, Rhs>;
    constexpr R kHigh = std::numeric_limits<R>::max();
    constexpr R kLow = std::numeric_limits<R>::lowest();

    const bool lhs_negative = is_negative(lhs);
    const bool rhs_negative = is_negative(rhs);

    if constexpr (op == ArithOp::Add) {
        return !lhs_negative && !rhs_negative ? kHigh : kLow;
    } else if constexpr (op == ArithOp::Sub) {
        return !lhs_negative && rhs_negative ? kHigh : kLow;
    } else if constexpr (op == ArithOp::Mul) {
        return lhs_negative != rhs_negative ? kLow : kHigh;
    } else if constexpr (op == ArithOp::Div) {
        if (rhs == Rhs{0}) {
            if (lhs == Lhs{0} || is_nan(lhs))
                return R{0};
            return lhs_negative ? kLow : kHigh;
        }
        return lhs_negative != rhs_negative ? kLow : kHigh;
    } else {
        return R{0};
    }
}
