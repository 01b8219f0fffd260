#pragma once
#include "tdb/error_codes.hpp"
#include "tdb/registers.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <sys/types.h>
#include <variant>

namespace tdb::target {

// In x86 0xcc (int3) is the instruction that identifies a breakpoint.
inline constexpr std::uint8_t trap_opcode = 0xcc;

// PTRACE_PEEKDATA/POKEDATA move one word at a time.
inline constexpr std::size_t word_size = sizeof(std::uint64_t);

struct stopped {
    int signal;
    std::uintptr_t instruction_pointer;
};

struct exited {
    int status;
};

struct signaled {
    int signal;
};

using stop_status = std::variant<stopped, exited, signaled>;

[[nodiscard]]
inline bool is_terminal(const stop_status& status) {
    return !std::holds_alternative<stopped>(status);
}

enum class wait_mode {
    blocking,
    nonblocking,
};

[[nodiscard]]
constexpr auto align_to_word(std::uintptr_t address) -> std::uintptr_t {
    return address & ~static_cast<std::uintptr_t>(word_size - 1);
}

// A single traced process. Everything that talks to the kernel lives behind
// this interface; the rest of the debugger only ever sees validated, word
// sized accesses.
class controller {
public:
    virtual ~controller() = default;

    [[nodiscard]] virtual auto pid() const -> pid_t = 0;

    [[nodiscard]]
    virtual auto wait(
        wait_mode mode = wait_mode::blocking
    ) -> tl::expected<stop_status, error::target> = 0;

    [[nodiscard]]
    virtual auto read_registers() -> tl::expected<registers::snapshot, error::target> = 0;

    [[nodiscard]]
    virtual auto write_registers(
        const registers::snapshot& regs
    ) -> tl::expected<void, error::target> = 0;

    // address must be word aligned.
    [[nodiscard]]
    virtual auto read_word(std::uintptr_t address) -> tl::expected<std::uint64_t, error::target> = 0;

    // address must be word aligned.
    [[nodiscard]]
    virtual auto write_word(
        std::uintptr_t address,
        std::uint64_t value
    ) -> tl::expected<void, error::target> = 0;

    [[nodiscard]] virtual auto resume() -> tl::expected<void, error::target> = 0;
    [[nodiscard]] virtual auto single_step() -> tl::expected<void, error::target> = 0;

    // Kills and reaps the process if it is still there. Returns true when a
    // kill was actually delivered.
    virtual auto terminate() -> bool = 0;

    // Replaces the byte at address with value and returns the byte that was
    // there before. The tracing interface only moves whole words, so this is a
    // read-modify-write of the aligned word containing address; the other
    // bytes of the word are written back unchanged.
    [[nodiscard]]
    auto patch_byte(
        std::uintptr_t address,
        std::uint8_t value
    ) -> tl::expected<std::uint8_t, error::target>;
};

}
