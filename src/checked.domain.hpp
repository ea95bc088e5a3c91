#pragma once

#include <limits>

#include <fmt/format.h>

#include "checked.diagnostics.hpp"
#include "checked.ops.hpp"

/// Inclusive [min, max] range a checked value must stay in. Defaults to everything the type can hold.
template <typename T> struct BoundedDomain {
    static_assert(NumericDomainType<T>, "domains are defined over built-in integer or floating point types");

    T min{std::numeric_limits<T>::lowest()};
    T max{std::numeric_limits<T>::max()};

    constexpr BoundedDomain() noexcept = default;

    constexpr BoundedDomain(const T lo, const T hi) : min{lo}, max{hi} {
        if (hi < lo) {
            terminate_on_violation(ViolationKind::InvalidDomain,
                                   fmt::format("domain [{}, {}] of {} is empty", lo, hi, numeric_type_name<T>()));
        }
    }

    constexpr bool contains(const T value) const noexcept { return min <= value && value <= max; }
    constexpr bool is_natural() const noexcept {
        return min == std::numeric_limits<T>::lowest() && max == std::numeric_limits<T>::max();
    }
};

template <typename T> inline constexpr BoundedDomain<T> kNaturalDomain{};
