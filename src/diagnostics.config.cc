#include "diagnostics.config.hpp"

#include <exception>
#include <string>

#include <rfl.hpp>
#include <rfl/json.hpp>

// rfl::Result::value() throws on a failed read, the message names the offending field.
tl::expected<DiagnosticsConfig, ConfigError> load_diagnostics_config(const std::filesystem::path& path) {
    try {
        return rfl::json::load<DiagnosticsConfig, rfl::DefaultIfMissing>(path.string()).value();
    } catch (const std::exception& e) {
        return tl::make_unexpected(ConfigError{.source = path.string(), .message = e.what()});
    }
}

tl::expected<DiagnosticsConfig, ConfigError> parse_diagnostics_config(const std::string_view json) {
    try {
        return rfl::json::read<DiagnosticsConfig, rfl::DefaultIfMissing>(std::string{json}).value();
    } catch (const std::exception& e) {
        return tl::make_unexpected(ConfigError{.source = "<inline json>", .message = e.what()});
    }
}
