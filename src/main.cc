#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include <tl/expected.hpp>
#include <tl/optional.hpp>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <fmt/format.h>

#include <lyra/lyra.hpp>

#include "checked.diagnostics.hpp"
#include "diagnostics.config.hpp"
#include "error.hpp"
#include "interval.hpp"

struct ProgramOptions {
    std::string start;
    std::string end;
    std::string op{"+"};
    std::string scalar;
    std::string value_type{"i64"};
    std::string policy{"abort"};
    std::string config_file;
    bool assign{false};
    bool show_help{false};
};

template <typename T> tl::optional<T> parse_number(const std::string_view text) {
    T value{};
    const char* text_end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), text_end, value);
    if (ec != std::errc{} || ptr != text_end) {
        return tl::nullopt;
    }
    return tl::optional<T>{value};
}

tl::optional<ArithOp> parse_op(const std::string_view text) {
    if (text == "+")
        return ArithOp::Add;
    if (text == "-")
        return ArithOp::Sub;
    if (text == "*")
        return ArithOp::Mul;
    if (text == "/")
        return ArithOp::Div;
    if (text == "%")
        return ArithOp::Mod;
    return tl::nullopt;
}

template <typename IntervalType, typename Scalar>
std::string apply_scalar(IntervalType interval, const ArithOp op, const Scalar scalar, const bool assign) {
    if (assign) {
        switch (op) {
        case ArithOp::Add:
            interval += scalar;
            break;
        case ArithOp::Sub:
            interval -= scalar;
            break;
        case ArithOp::Mul:
            interval *= scalar;
            break;
        case ArithOp::Div:
            interval /= scalar;
            break;
        case ArithOp::Mod:
            interval %= scalar;
            break;
        case ArithOp::Negate:
            break;
        }
        return fmt::format("{}", interval);
    }

    switch (op) {
    case ArithOp::Add:
        return fmt::format("{}", interval + scalar);
    case ArithOp::Sub:
        return fmt::format("{}", interval - scalar);
    case ArithOp::Mul:
        return fmt::format("{}", interval * scalar);
    case ArithOp::Div:
        return fmt::format("{}", interval / scalar);
    case ArithOp::Mod:
        return fmt::format("{}", interval % scalar);
    case ArithOp::Negate:
        break;
    }
    return fmt::format("{}", interval);
}

template <typename Policy, typename T>
tl::expected<std::string, GenericProgramError> run_calc(const ProgramOptions& prog_opts) {
    using Value = CheckedValue<T, Policy>;
    using CalcInterval = Interval<Value, Value>;

    const tl::optional<T> start = parse_number<T>(prog_opts.start);
    if (!start) {
        return tl::make_unexpected(ArgumentError{
            "--start", fmt::format("'{}' is not a {} number", prog_opts.start, numeric_type_name<T>())});
    }

    const tl::optional<T> end = parse_number<T>(prog_opts.end);
    if (!end) {
        return tl::make_unexpected(
            ArgumentError{"--end", fmt::format("'{}' is not a {} number", prog_opts.end, numeric_type_name<T>())});
    }

    const tl::optional<ArithOp> op = parse_op(prog_opts.op);
    if (!op) {
        return tl::make_unexpected(ArgumentError{"--op", fmt::format("unknown operator '{}'", prog_opts.op)});
    }

    auto interval = CalcInterval::create(Value{*start}, Value{*end});
    if (!interval) {
        return tl::make_unexpected(interval.error());
    }

    LOG_INFO(g_logger, "{} {} {} (policy {}, assign {})", fmt::format("{}", *interval), prog_opts.op, prog_opts.scalar,
             prog_opts.policy, prog_opts.assign);

    if (const tl::optional<int64_t> int_scalar = parse_number<int64_t>(prog_opts.scalar); int_scalar) {
        return apply_scalar(*interval, *op, *int_scalar, prog_opts.assign);
    }
    if (const tl::optional<double> fp_scalar = parse_number<double>(prog_opts.scalar); fp_scalar) {
        return apply_scalar(*interval, *op, *fp_scalar, prog_opts.assign);
    }

    return tl::make_unexpected(
        ArgumentError{"--scalar", fmt::format("'{}' is neither an integer nor a real number", prog_opts.scalar)});
}

template <typename Policy>
tl::expected<std::string, GenericProgramError> run_with_type(const ProgramOptions& prog_opts) {
    if (prog_opts.value_type == "i32")
        return run_calc<Policy, int32_t>(prog_opts);
    if (prog_opts.value_type == "i64")
        return run_calc<Policy, int64_t>(prog_opts);
    if (prog_opts.value_type == "u32")
        return run_calc<Policy, uint32_t>(prog_opts);
    if (prog_opts.value_type == "f64")
        return run_calc<Policy, double>(prog_opts);

    return tl::make_unexpected(
        ArgumentError{"--type", fmt::format("unsupported value type '{}'", prog_opts.value_type)});
}

int main(int argc, char** argv) {
    ProgramOptions prog_opts{};
    auto cli =
        lyra::cli{} | lyra::help(prog_opts.show_help) |
        lyra::opt{prog_opts.start, "start"}["-s"]["--start"]("Lower bound of the interval").required() |
        lyra::opt{prog_opts.end, "end"}["-e"]["--end"]("Upper bound of the interval").required() |
        lyra::opt{prog_opts.op, "op"}["-o"]["--op"]("Operator applied to both bounds (+ - * / %)")
            .choices([](const std::string& op) { return parse_op(op).has_value(); }) |
        lyra::opt{prog_opts.scalar, "scalar"}["-k"]["--scalar"]("Integer or real operand").required() |
        lyra::opt{prog_opts.value_type, "type"}["-t"]["--type"]("Bound type (i32, i64, u32, f64)")
            .choices([](const std::string& t) { return t == "i32" || t == "i64" || t == "u32" || t == "f64"; }) |
        lyra::opt{prog_opts.policy, "policy"}["-p"]["--policy"]("Violation policy (abort, warn, saturate)")
            .choices([](const std::string& p) { return p == "abort" || p == "warn" || p == "saturate"; }) |
        lyra::opt{prog_opts.assign}["-a"]["--assign"]("Use the compound assignment operator") |
        lyra::opt{prog_opts.config_file, "config"}["-c"]["--config"]("Diagnostics configuration (JSON)");

    if (const auto arg_parse_res = cli.parse({argc, argv}); !arg_parse_res) {
        fmt::print(stderr, "{}\n", arg_parse_res.message());
        return EXIT_FAILURE;
    }

    if (prog_opts.show_help) {
        std::cout << cli << "\n";
        return EXIT_SUCCESS;
    }

    DiagnosticsConfig diag_cfg{};
    if (!prog_opts.config_file.empty()) {
        const auto loaded_cfg = load_diagnostics_config(prog_opts.config_file);
        if (!loaded_cfg) {
            fmt::print(stderr, "{}\n", describe_program_error(loaded_cfg.error()));
            return EXIT_FAILURE;
        }
        diag_cfg = *loaded_cfg;
    }
    diagnostics_setup(diag_cfg);

    const tl::expected<std::string, GenericProgramError> calc_result =
        prog_opts.policy == "warn"       ? run_with_type<WarnPolicy>(prog_opts)
        : prog_opts.policy == "saturate" ? run_with_type<SaturatePolicy>(prog_opts)
                                         : run_with_type<AbortPolicy>(prog_opts);

    if (!calc_result) {
        log_program_error(g_logger, calc_result.error());
        fmt::print(stderr, "{}\n", describe_program_error(calc_result.error()));
        return EXIT_FAILURE;
    }

    fmt::print("{}\n", *calc_result);
    return EXIT_SUCCESS;
}
