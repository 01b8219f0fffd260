#include "tdb/execution.hpp"

#include <fmt/core.h>

#include <csignal>
#include <cstdio>

namespace {

// Puts the trap back after the original byte was restored. Used on the error
// paths so that an aborted continue leaves memory matching the table.
auto rearm(tdb::target::controller& target, std::uintptr_t address) -> void {
    if(!target.patch_byte(address, tdb::target::trap_opcode)) {
        fmt::print(stderr, "Failed to re-enable breakpoint at {:#x}.\n", address);
    }
}

}

namespace tdb::execution {

auto step_over_breakpoint(
    target::controller& target,
    const breakpoints::table& breakpoints
) -> tl::expected<std::optional<target::stop_status>, error::target> {
    auto regs = target.read_registers();
    if(!regs) {
        return tl::make_unexpected(regs.error());
    }

    // The trap is one byte long, so after hitting it the instruction pointer
    // is one past the breakpoint address.
    const std::uintptr_t possible_bp_location = regs->instruction_pointer() - 1;

    const auto saved_data = breakpoints.lookup(possible_bp_location);
    if(!saved_data) {
        return std::nullopt;
    }

    const auto restored = target.patch_byte(possible_bp_location, *saved_data);
    if(!restored) {
        return tl::make_unexpected(restored.error());
    }

    regs->set_instruction_pointer(possible_bp_location);
    const auto rewound = target.write_registers(*regs);
    if(!rewound) {
        rearm(target, possible_bp_location);
        return tl::make_unexpected(rewound.error());
    }

    const auto stepped = target.single_step();
    if(!stepped) {
        rearm(target, possible_bp_location);
        return tl::make_unexpected(stepped.error());
    }

    const auto status = target.wait();
    if(!status) {
        rearm(target, possible_bp_location);
        return tl::make_unexpected(status.error());
    }

    // Nothing to re-arm in a process that is gone.
    if(target::is_terminal(*status)) {
        return *status;
    }

    const auto rearmed = target.patch_byte(possible_bp_location, target::trap_opcode);
    if(!rearmed) {
        return tl::make_unexpected(rearmed.error());
    }

    return std::nullopt;
}

auto continue_execution(
    target::controller& target,
    const breakpoints::table& breakpoints
) -> tl::expected<target::stop_status, error::target> {
    const auto stepped = step_over_breakpoint(target, breakpoints);
    if(!stepped) {
        return tl::make_unexpected(stepped.error());
    }

    if(*stepped) {
        return **stepped;
    }

    const auto resumed = target.resume();
    if(!resumed) {
        return tl::make_unexpected(resumed.error());
    }

    return target.wait();
}

auto breakpoint_hit(
    const target::stop_status& status,
    const breakpoints::table& breakpoints
) -> std::optional<std::uintptr_t> {
    const auto* stop = std::get_if<target::stopped>(&status);
    if(stop == nullptr || stop->signal != SIGTRAP) {
        return std::nullopt;
    }

    const std::uintptr_t address = stop->instruction_pointer - 1;
    if(!breakpoints.lookup(address)) {
        return std::nullopt;
    }

    return address;
}

}
