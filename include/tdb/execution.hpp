#pragma once
#include "tdb/breakpoints.hpp"
#include "tdb/error_codes.hpp"
#include "tdb/target.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>

namespace tdb::execution {

// If the target is sitting right after one of our traps, runs the original
// instruction once with the trap removed and puts the trap back. Returns the
// terminal status if the process ended during that single step, nullopt if
// the target is stopped and ready to be resumed.
[[nodiscard]]
auto step_over_breakpoint(
    target::controller& target,
    const breakpoints::table& breakpoints
) -> tl::expected<std::optional<target::stop_status>, error::target>;

// Resumes the target until its next stop, stepping over the breakpoint it is
// currently stopped at if there is one.
[[nodiscard]]
auto continue_execution(
    target::controller& target,
    const breakpoints::table& breakpoints
) -> tl::expected<target::stop_status, error::target>;

// Address of the breakpoint that produced status, if status is a SIGTRAP stop
// right after an armed trap.
[[nodiscard]]
auto breakpoint_hit(
    const target::stop_status& status,
    const breakpoints::table& breakpoints
) -> std::optional<std::uintptr_t>;

}
