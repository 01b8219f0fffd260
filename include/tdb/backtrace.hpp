#pragma once
#include "tdb/error_codes.hpp"
#include "tdb/symbols.hpp"
#include "tdb/target.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tdb::backtrace {

struct frame {
    std::uintptr_t address;
    std::optional<std::string> function;
    std::optional<symbols::line_descriptor> line;
};

inline constexpr std::size_t max_frames = 1024;

// Unwinds the stack of a stopped target by following the rbp chain: the
// caller's rbp is saved at [rbp] and the return address at [rbp + 8]. This
// only works for code compiled with frame pointers. The walk ends at
// entry_function, at the first frame whose function cannot be resolved, or
// after max_frames frames.
[[nodiscard]]
auto walk(
    target::controller& target,
    const symbols::resolver& resolver,
    std::string_view entry_function = "main"
) -> tl::expected<std::vector<frame>, error::target>;

}
