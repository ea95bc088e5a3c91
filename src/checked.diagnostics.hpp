#pragma once

#include <cstdint>
#include <string_view>

#include <quill/Logger.h>

struct DiagnosticsConfig;

enum class ViolationKind : uint8_t {
    BadCast,
    LowerBound,
    UpperBound,
    SignMismatchComparison,
    UnorderedComparison,
    ArithmeticOverflow,
    InvalidDomain,
    IntervalInvariant,
};

std::string_view violation_kind_name(const ViolationKind kind) noexcept;

extern quill::Logger* g_logger;

// Logger installed by diagnostics_setup(), or a console logger created on first use.
quill::Logger* diagnostics_logger();

void diagnostics_setup(const DiagnosticsConfig& cfg);

void report_violation(const ViolationKind kind, const std::string_view description);

/// Logs the violation as critical, flushes the log, repeats the diagnostic on stderr and aborts the process.
[[noreturn]] void terminate_on_violation(const ViolationKind kind, const std::string_view description);
