#pragma once

#include <string>
#include <variant>

#include <quill/Logger.h>

struct IntervalError {
    std::string start;
    std::string end;
};

struct ConfigError {
    std::string source;
    std::string message;
};

struct ArgumentError {
    std::string argument;
    std::string message;
};

using GenericProgramError = std::variant<std::monostate, IntervalError, ConfigError, ArgumentError>;

std::string describe_program_error(const GenericProgramError& err);
void log_program_error(quill::Logger* logger, const GenericProgramError& err);
