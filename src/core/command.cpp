#include "core/command.hpp"

#include "core/overloaded.hpp"

namespace cardpipe {

std::string_view keyword_of(const CommandOp &op) noexcept {
    return std::visit(
        overloaded{
            [](const ConsoleCommand &) -> std::string_view { return "CONSOLE"; },
            [](const FilterCommand &) -> std::string_view { return "FILTER"; },
            [](const LocateCommand &locate) -> std::string_view { return locate.negate ? "NLOCATE" : "LOCATE"; },
            [](const ChangeCommand &) -> std::string_view { return "CHANGE"; },
            [](const SelectCommand &) -> std::string_view { return "SELECT"; },
            [](const UpperCommand &) -> std::string_view { return "UPPER"; },
            [](const LowerCommand &) -> std::string_view { return "LOWER"; },
            [](const ReverseCommand &) -> std::string_view { return "REVERSE"; },
            [](const TakeCommand &) -> std::string_view { return "TAKE"; },
            [](const SkipCommand &) -> std::string_view { return "SKIP"; },
            [](const DuplicateCommand &) -> std::string_view { return "DUPLICATE"; },
            [](const CountCommand &) -> std::string_view { return "COUNT"; },
            [](const LiteralCommand &) -> std::string_view { return "LITERAL"; },
            [](const HoleCommand &) -> std::string_view { return "HOLE"; },
        },
        op);
}

bool is_console(const Endpoint &endpoint) noexcept { return std::holds_alternative<ConsoleEndpoint>(endpoint); }

} // namespace cardpipe
