#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "checked.diagnostics.hpp"
#include "checked.ops.hpp"

template <typename Dst, typename Src> std::string describe_bad_cast(const Src src) {
    return fmt::format("cast of {} ({}) to {} does not preserve the value", src, numeric_type_name<Src>(),
                       numeric_type_name<Dst>());
}

template <typename Rhs, typename T>
std::string describe_bound(const Rhs rhs, const T bound, const std::string_view relation) {
    return fmt::format("value {} ({}) is {} the domain bound {} ({})", rhs, numeric_type_name<Rhs>(), relation,
                       bound, numeric_type_name<T>());
}

template <typename Lhs, typename Rhs>
std::string describe_comparison(const std::string_view op, const Lhs lhs, const Rhs rhs) {
    return fmt::format("{} ({}) {} {} ({}) is not a sound comparison", lhs, numeric_type_name<Lhs>(), op, rhs,
                       numeric_type_name<Rhs>());
}

// NaN on either side makes the comparison unordered, anything else flagged is a sign mismatch.
template <typename Lhs, typename Rhs> constexpr ViolationKind comparison_violation(const Lhs lhs, const Rhs rhs) {
    return is_nan(lhs) || is_nan(rhs) ? ViolationKind::UnorderedComparison : ViolationKind::SignMismatchComparison;
}

template <ArithOp op, typename Lhs> std::string describe_overflow(const Lhs lhs) {
    return fmt::format("{}{} ({}) does not fit {}", arith_op_symbol(op), lhs, numeric_type_name<Lhs>(),
                       numeric_type_name<NegateResult<Lhs>>());
}

template <ArithOp op, typename Lhs, typename Rhs> std::string describe_overflow(const Lhs lhs, const Rhs rhs) {
    return fmt::format("{} ({}) {} {} ({}) does not fit {}", lhs, numeric_type_name<Lhs>(), arith_op_symbol(op), rhs,
                       numeric_type_name<Rhs>(), numeric_type_name<ArithResult<Lhs, Rhs>>());
}

/// Hooks a CheckedValue calls when an operation is unsafe. Every hook returns the value the operation continues
/// with, a policy may also never return. `hook_op_cmp` receives the ordering operator written at the call site.
template <typename P>
concept CheckedPolicy = requires(const int32_t v, const int64_t w, const std::string_view op) {
    { P::template on_bad_cast<int32_t>(w) } -> std::same_as<int32_t>;
    { P::on_lower_bound(w, v) } -> std::same_as<int32_t>;
    { P::on_upper_bound(w, v) } -> std::same_as<int32_t>;
    { P::hook_op_equals(v, w) } -> std::same_as<bool>;
    { P::hook_op_cmp(v, w, op) } -> std::same_as<int>;
    { P::template on_overflow<ArithOp::Negate>(v) } -> std::same_as<int32_t>;
    { P::template on_overflow<ArithOp::Add>(v, w) } -> std::same_as<int64_t>;
};

/// Reports every violation and terminates the process. Comparisons that the sign-safe routine accepts return
/// their result.
struct AbortPolicy {
    template <typename Dst, typename Src> [[noreturn]] static Dst on_bad_cast(const Src src) {
        terminate_on_violation(ViolationKind::BadCast, describe_bad_cast<Dst>(src));
    }

    template <typename Rhs, typename T> [[noreturn]] static T on_lower_bound(const Rhs rhs, const T bound) {
        terminate_on_violation(ViolationKind::LowerBound, describe_bound(rhs, bound, "below"));
    }

    template <typename Rhs, typename T> [[noreturn]] static T on_upper_bound(const Rhs rhs, const T bound) {
        terminate_on_violation(ViolationKind::UpperBound, describe_bound(rhs, bound, "above"));
    }

    template <typename Lhs, typename Rhs> static bool hook_op_equals(const Lhs lhs, const Rhs rhs) {
        bool error{false};
        const bool result = checked_equals(lhs, rhs, error);
        if (error) {
            terminate_on_violation(ViolationKind::SignMismatchComparison, describe_comparison("==", lhs, rhs));
        }
        return result;
    }

    template <typename Lhs, typename Rhs>
    static int hook_op_cmp(const Lhs lhs, const Rhs rhs, const std::string_view op = "<=>") {
        bool error{false};
        const int result = checked_cmp(lhs, rhs, error);
        if (error) {
            terminate_on_violation(comparison_violation(lhs, rhs), describe_comparison(op, lhs, rhs));
        }
        return result;
    }

    template <ArithOp op, typename Lhs> [[noreturn]] static NegateResult<Lhs> on_overflow(const Lhs lhs) {
        terminate_on_violation(ViolationKind::ArithmeticOverflow, describe_overflow<op>(lhs));
    }

    template <ArithOp op, typename Lhs, typename Rhs>
    [[noreturn]] static ArithResult<Lhs, Rhs> on_overflow(const Lhs lhs, const Rhs rhs) {
        terminate_on_violation(ViolationKind::ArithmeticOverflow, describe_overflow<op>(lhs, rhs));
    }
};

/// Reports every violation and carries on with the value plain C++ arithmetic would have produced.
struct WarnPolicy {
    template <typename Dst, typename Src> static Dst on_bad_cast(const Src src) {
        report_violation(ViolationKind::BadCast, describe_bad_cast<Dst>(src));
        return wrapping_cast<Dst>(src);
    }

    template <typename Rhs, typename T> static T on_lower_bound(const Rhs rhs, const T bound) {
        report_violation(ViolationKind::LowerBound, describe_bound(rhs, bound, "below"));
        return wrapping_cast<T>(rhs);
    }

    template <typename Rhs, typename T> static T on_upper_bound(const Rhs rhs, const T bound) {
        report_violation(ViolationKind::UpperBound, describe_bound(rhs, bound, "above"));
        return wrapping_cast<T>(rhs);
    }

    template <typename Lhs, typename Rhs> static bool hook_op_equals(const Lhs lhs, const Rhs rhs) {
        bool error{false};
        const bool result = checked_equals(lhs, rhs, error);
        if (error) {
            report_violation(ViolationKind::SignMismatchComparison, describe_comparison("==", lhs, rhs));
        }
        return result;
    }

    template <typename Lhs, typename Rhs>
    static int hook_op_cmp(const Lhs lhs, const Rhs rhs, const std::string_view op = "<=>") {
        bool error{false};
        const int result = checked_cmp(lhs, rhs, error);
        if (error) {
            report_violation(comparison_violation(lhs, rhs), describe_comparison(op, lhs, rhs));
        }
        return result;
    }

    template <ArithOp op, typename Lhs> static NegateResult<Lhs> on_overflow(const Lhs lhs) {
        report_violation(ViolationKind::ArithmeticOverflow, describe_overflow<op>(lhs));
        return wrapped_result<op>(lhs);
    }

    template <ArithOp op, typename Lhs, typename Rhs>
    static ArithResult<Lhs, Rhs> on_overflow(const Lhs lhs, const Rhs rhs) {
        report_violation(ViolationKind::ArithmeticOverflow, describe_overflow<op>(lhs, rhs));
        return wrapped_result<op>(lhs, rhs);
    }
};

/// Silently clamps: casts and overflows go to the nearest representable extreme, bound violations to the bound.
struct SaturatePolicy {
    template <typename Dst, typename Src> static Dst on_bad_cast(const Src src) { return saturating_cast<Dst>(src); }

    template <typename Rhs, typename T> static T on_lower_bound(const Rhs, const T bound) { return bound; }
    template <typename Rhs, typename T> static T on_upper_bound(const Rhs, const T bound) { return bound; }

    // The sign-safe result is exact, mixed sign comparisons are accepted as they are.
    template <typename Lhs, typename Rhs> static bool hook_op_equals(const Lhs lhs, const Rhs rhs) {
        bool error{false};
        return checked_equals(lhs, rhs, error);
    }

    template <typename Lhs, typename Rhs>
    static int hook_op_cmp(const Lhs lhs, const Rhs rhs, const std::string_view = "<=>") {
        bool error{false};
        return checked_cmp(lhs, rhs, error);
    }

    template <ArithOp op, typename Lhs> static NegateResult<Lhs> on_overflow(const Lhs lhs) {
        return saturated_result<op>(lhs);
    }

    template <ArithOp op, typename Lhs, typename Rhs>
    static ArithResult<Lhs, Rhs> on_overflow(const Lhs lhs, const Rhs rhs) {
        return saturated_result<op>(lhs, rhs);
    }
};

static_assert(CheckedPolicy<AbortPolicy>);
static_assert(CheckedPolicy<WarnPolicy>);
static_assert(CheckedPolicy<SaturatePolicy>);
