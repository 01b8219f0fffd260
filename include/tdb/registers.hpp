#pragma once
#include "tdb/error_codes.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <sys/user.h>

namespace tdb::registers {

enum class reg {
    rax, rbx, rcx, rdx,
    rdi, rsi, rbp, rsp,
    r8,  r9,  r10, r11,
    r12, r13, r14, r15,
    rip, eflags,    cs,
    orig_rax, fs_base,
    gs_base,
    fs, gs, ss, ds, es
};

// Whole register set of a stopped target, as returned by PTRACE_GETREGS.
// Reading or modifying a snapshot never touches the target; it has to be
// written back through target::controller::write_registers.
class snapshot {
public:
    snapshot() = default;
    explicit snapshot(const user_regs_struct& regs) : regs_(regs) {}

    [[nodiscard]] auto value(reg r) const -> std::uint64_t;
    auto set(reg r, std::uint64_t value) -> void;

    [[nodiscard]] auto instruction_pointer() const -> std::uint64_t { return regs_.rip; }
    [[nodiscard]] auto frame_base() const -> std::uint64_t { return regs_.rbp; }
    auto set_instruction_pointer(std::uint64_t value) -> void { regs_.rip = value; }

    [[nodiscard]] auto raw() const -> const user_regs_struct& { return regs_; }
    [[nodiscard]] auto raw() -> user_regs_struct& { return regs_; }

private:
    user_regs_struct regs_{};
};

[[nodiscard]]
auto to_string(reg r) -> std::string;

[[nodiscard]]
auto from_string(std::string_view r) -> tl::expected<reg, error::registers>;

// One "name: value" line per register, in the order of the reg enum.
[[nodiscard]]
auto format(const snapshot& regs) -> std::string;

}
