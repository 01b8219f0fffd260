#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tdb::command {

enum class kind {
    run,
    cont,
    backtrace,
    breakpoint,
    kill,
    registers,
    quit,
};

struct command {
    kind type;
    std::vector<std::string> args;
};

// Tokenizes line on spaces and maps the first token to a command. Any non
// empty prefix of a command name selects it; names are tried in the order of
// the kind enum so that "b" is break and "r" is run. "bt" is accepted as an
// alias of backtrace. Returns nullopt for blank or unknown input.
[[nodiscard]]
auto parse(std::string_view line) -> std::optional<command>;

}
