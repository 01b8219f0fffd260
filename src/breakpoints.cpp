#include "tdb/breakpoints.hpp"

namespace tdb::breakpoints {

auto table::register_address(std::uintptr_t address) -> registration {
    const auto bp_it = breakpoints_.find(address);
    if(bp_it != breakpoints_.cend()) {
        return {registration_status::already_registered, bp_it->second.id};
    }

    const std::size_t id = breakpoints_.size();
    breakpoints_.emplace(address, breakpoint{id, address});

    return {registration_status::registered, id};
}

auto table::arm_all(target::controller& target) -> std::vector<std::uintptr_t> {
    std::vector<std::uintptr_t> failed;

    for(auto& [address, bp] : breakpoints_) {
        if(bp.armed) {
            continue;
        }

        const auto saved = target.patch_byte(address, target::trap_opcode);
        if(!saved) {
            failed.push_back(address);
            continue;
        }

        // The breakpoint is modified only after a successful patch so that in
        // case of errors there is no leftover data in it.
        bp.saved_data = *saved;
        bp.armed = true;
    }

    return failed;
}

auto table::lookup(std::uintptr_t address) const -> std::optional<std::uint8_t> {
    const auto bp_it = breakpoints_.find(address);
    if(bp_it == breakpoints_.cend() || !bp_it->second.armed) {
        return std::nullopt;
    }

    return bp_it->second.saved_data;
}

auto table::disarm_for_restart() -> void {
    for(auto& [_, bp] : breakpoints_) {
        bp.armed = false;
        bp.saved_data = 0;
    }
}

bool table::contains(std::uintptr_t address) const {
    return breakpoints_.find(address) != breakpoints_.cend();
}

auto table::find(std::uintptr_t address) const -> const breakpoint* {
    const auto bp_it = breakpoints_.find(address);
    return bp_it == breakpoints_.cend() ? nullptr : &bp_it->second;
}

}
