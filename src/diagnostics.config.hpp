#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "error.hpp"

enum class DiagnosticsSink : uint8_t { Console, File };

enum class DiagnosticsLevel : uint8_t { Debug, Info, Warning, Error, Critical };

struct DiagnosticsConfig {
    DiagnosticsSink sink{DiagnosticsSink::Console};
    std::string log_file{"checked.arith.log"};
    DiagnosticsLevel log_level{DiagnosticsLevel::Warning};
    std::string format_pattern{"%(time) [%(thread_id)] %(source_location:<28) "
                               "LOG_%(log_level:<9) %(logger:<12) %(message)"};
};

tl::expected<DiagnosticsConfig, ConfigError> load_diagnostics_config(const std::filesystem::path& path);
tl::expected<DiagnosticsConfig, ConfigError> parse_diagnostics_config(const std::string_view json);
