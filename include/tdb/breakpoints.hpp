#pragma once
#include "tdb/target.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace tdb::breakpoints {

struct breakpoint {
    std::size_t id;
    std::uintptr_t address;
    bool armed = false;
    std::uint8_t saved_data = 0;
};

enum class registration_status {
    registered,
    already_registered,
};

struct registration {
    registration_status status;
    std::size_t id;
};

// Every breakpoint the user asked for, keyed by address. Entries outlive the
// targets they were armed in: when a target goes away they fall back to
// unarmed and get armed again in the next one.
class table {
public:
    auto register_address(std::uintptr_t address) -> registration;

    // Writes the trap opcode over every unarmed breakpoint. Returns the
    // addresses that could not be patched; those stay unarmed.
    [[nodiscard]] auto arm_all(target::controller& target) -> std::vector<std::uintptr_t>;

    // Saved original byte of the armed breakpoint at address, if any.
    [[nodiscard]] auto lookup(std::uintptr_t address) const -> std::optional<std::uint8_t>;

    auto disarm_for_restart() -> void;

    [[nodiscard]] bool contains(std::uintptr_t address) const;
    [[nodiscard]] auto find(std::uintptr_t address) const -> const breakpoint*;
    [[nodiscard]] auto size() const -> std::size_t { return breakpoints_.size(); }
    [[nodiscard]] bool empty() const { return breakpoints_.empty(); }

    auto begin() const { return breakpoints_.cbegin(); }
    auto end() const { return breakpoints_.cend(); }

private:
    std::map<std::uintptr_t, breakpoint> breakpoints_;
};

}
