#include "error.hpp"

#include <utility>

#include <fmt/format.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

template<typename... Visitors>
struct VariantVisitor : public Visitors...
{
    VariantVisitor()
        : Visitors{}...
    {
    }
    VariantVisitor(Visitors&&... visitors)
        : Visitors{ std::forward<Visitors>(visitors) }...
    {
    }

    using Visitors::operator()...;
};

std::string
describe_program_error(const GenericProgramError& err)
{
    return std::visit(VariantVisitor{
                          [](const IntervalError& e) {
                              return fmt::format("invalid interval boundaries: start {} > end {}", e.start, e.end);
                          },
                          [](const ConfigError& e) {
                              return fmt::format("configuration error ({}): {}", e.source, e.message);
                          },
                          [](const ArgumentError& e) { return fmt::format("argument {}: {}", e.argument, e.message); },
                          [](std::monostate) { return std::string{"no error"}; },
                      },
                      err);
}

void
log_program_error(quill::Logger* logger, const GenericProgramError& err)
{
    if (std::holds_alternative<std::monostate>(err))
        return;

    LOG_ERROR(logger, "{}", describe_program_error(err));
}
