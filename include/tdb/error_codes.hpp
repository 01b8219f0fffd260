#pragma once

#include <string>
#include <string_view>

namespace tdb::error {

enum class launch {
    fork_fail,
    exec_fail,
    unexpected_stop,
    wait_fail,
};

// Failures of an operation against a live (or recently live) target. peek_fail
// and poke_fail are the memory access errors: the address is not mapped in the
// target or the kernel refused the access.
enum class target {
    peek_fail,
    poke_fail,
    misaligned_address,
    getregs_fail,
    setregs_fail,
    resume_fail,
    step_fail,
    wait_fail,
    still_running,
};

enum class registers {
    unknown_reg_name,
};

enum class address {
    malformed_address,
};

enum class symbols {
    open_fail,
    format_error,
};

// A symbol loading failure together with whatever detail the ELF/DWARF reader
// gave us. detail is empty for open_fail.
struct symbols_failure {
    symbols kind;
    std::string detail;
};

[[nodiscard]] auto to_string(launch e) -> std::string_view;
[[nodiscard]] auto to_string(target e) -> std::string_view;
[[nodiscard]] auto to_string(registers e) -> std::string_view;
[[nodiscard]] auto to_string(address e) -> std::string_view;
[[nodiscard]] auto to_string(symbols e) -> std::string_view;

}
