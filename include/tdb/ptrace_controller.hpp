#pragma once
#include "tdb/error_codes.hpp"
#include "tdb/target.hpp"

#include <tl/expected.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tdb::target {

class ptrace_controller final : public controller {
public:
    // Forks and executes path with args under PTRACE_TRACEME, then waits for
    // the SIGTRAP the kernel delivers once the new image is loaded. On success
    // the target is stopped before its first instruction.
    [[nodiscard]]
    static auto spawn(
        const std::string& path,
        const std::vector<std::string>& args
    ) -> tl::expected<std::unique_ptr<ptrace_controller>, error::launch>;

    ~ptrace_controller() override;

    ptrace_controller(const ptrace_controller&) = delete;
    ptrace_controller& operator=(const ptrace_controller&) = delete;

    [[nodiscard]] auto pid() const -> pid_t override { return pid_; }

    [[nodiscard]]
    auto wait(wait_mode mode) -> tl::expected<stop_status, error::target> override;

    [[nodiscard]]
    auto read_registers() -> tl::expected<registers::snapshot, error::target> override;

    [[nodiscard]]
    auto write_registers(
        const registers::snapshot& regs
    ) -> tl::expected<void, error::target> override;

    [[nodiscard]]
    auto read_word(std::uintptr_t address) -> tl::expected<std::uint64_t, error::target> override;

    [[nodiscard]]
    auto write_word(
        std::uintptr_t address,
        std::uint64_t value
    ) -> tl::expected<void, error::target> override;

    [[nodiscard]] auto resume() -> tl::expected<void, error::target> override;
    [[nodiscard]] auto single_step() -> tl::expected<void, error::target> override;

    auto terminate() -> bool override;

private:
    explicit ptrace_controller(pid_t pid) : pid_(pid) {}

    pid_t pid_;

    // Set once the process has been reaped. From then on the pid may belong
    // to somebody else, so nothing is sent to it anymore.
    std::optional<stop_status> final_status_;
};

}
