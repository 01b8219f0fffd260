#include "tdb/command.hpp"
#include "tdb/util.hpp"

#include <array>
#include <utility>

namespace {

using tdb::command::kind;

// Ordered: break before backtrace, run before registers.
const std::array<std::pair<kind, std::string_view>, 7> command_names = {{
    {kind::run,        "run"},
    {kind::cont,       "continue"},
    {kind::breakpoint, "break"},
    {kind::backtrace,  "backtrace"},
    {kind::kill,       "kill"},
    {kind::registers,  "register"},
    {kind::quit,       "quit"},
}};

}

namespace tdb::command {

auto parse(std::string_view line) -> std::optional<command> {
    const std::vector<std::string_view> tokens = util::split(line, ' ');

    if(tokens.empty()) {
        return std::nullopt;
    }

    const std::string_view name = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if(name == "bt") {
        return command{kind::backtrace, std::move(args)};
    }

    for(const auto& [type, full_name] : command_names) {
        if(util::is_prefix(name, full_name)) {
            return command{type, std::move(args)};
        }
    }

    return std::nullopt;
}

}
