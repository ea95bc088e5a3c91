#include "interval.hpp"

#include <fmt/format.h>

#include "checked.diagnostics.hpp"

void interval_invariant_failure(const std::string_view start, const std::string_view end) {
    terminate_on_violation(ViolationKind::IntervalInvariant,
                           fmt::format("invalid interval boundaries: start {} > end {}", start, end));
}
