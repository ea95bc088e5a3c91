#include "checked.diagnostics.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <utility>

#include <fmt/format.h>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include "diagnostics.config.hpp"

quill::Logger* g_logger{};

namespace {

quill::LogLevel to_quill_level(const DiagnosticsLevel level) noexcept {
    switch (level) {
    case DiagnosticsLevel::Debug:
        return quill::LogLevel::Debug;
    case DiagnosticsLevel::Info:
        return quill::LogLevel::Info;
    case DiagnosticsLevel::Warning:
        return quill::LogLevel::Warning;
    case DiagnosticsLevel::Error:
        return quill::LogLevel::Error;
    case DiagnosticsLevel::Critical:
        return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Warning;
}

std::once_flag g_default_logger_flag;

} // namespace

std::string_view violation_kind_name(const ViolationKind kind) noexcept {
    switch (kind) {
    case ViolationKind::BadCast:
        return "BadCast";
    case ViolationKind::LowerBound:
        return "LowerBoundViolation";
    case ViolationKind::UpperBound:
        return "UpperBoundViolation";
    case ViolationKind::SignMismatchComparison:
        return "SignMismatchComparison";
    case ViolationKind::UnorderedComparison:
        return "UnorderedComparison";
    case ViolationKind::ArithmeticOverflow:
        return "ArithmeticOverflow";
    case ViolationKind::InvalidDomain:
        return "InvalidDomain";
    case ViolationKind::IntervalInvariant:
        return "IntervalInvariantViolation";
    }
    return "Unknown";
}

void diagnostics_setup(const DiagnosticsConfig& cfg) {
    quill::Backend::start();

    quill::PatternFormatterOptions pfo;
    pfo.format_pattern = cfg.format_pattern;
    pfo.timestamp_pattern = ("%H:%M:%S.%Qns");
    pfo.timestamp_timezone = quill::Timezone::GmtTime;

    if (cfg.sink == DiagnosticsSink::File) {
        auto file_sink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            cfg.log_file,
            []() {
                quill::FileSinkConfig file_cfg;
                file_cfg.set_open_mode('w');
                return file_cfg;
            }(),
            quill::FileEventNotifier{});
        g_logger = quill::Frontend::create_or_get_logger("checked_file", std::move(file_sink), pfo);
    } else {
        auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("checked_console_sink");
        g_logger = quill::Frontend::create_or_get_logger("checked_console", std::move(console_sink), pfo);
    }

    g_logger->set_log_level(to_quill_level(cfg.log_level));
}

quill::Logger* diagnostics_logger() {
    std::call_once(g_default_logger_flag, []() {
        if (!g_logger) {
            diagnostics_setup(DiagnosticsConfig{});
        }
    });
    return g_logger;
}

void report_violation(const ViolationKind kind, const std::string_view description) {
    LOG_WARNING(diagnostics_logger(), "{} : {}", violation_kind_name(kind), description);
}

void terminate_on_violation(const ViolationKind kind, const std::string_view description) {
    quill::Logger* logger = diagnostics_logger();
    LOG_CRITICAL(logger, "{} : {}", violation_kind_name(kind), description);
    if (quill::Backend::is_running()) {
        logger->flush_log();
    }
    // The configured sink may be a file, the last words always go to stderr as well.
    fmt::print(stderr, "{} : {}\n", violation_kind_name(kind), description);
    std::abort();
}
