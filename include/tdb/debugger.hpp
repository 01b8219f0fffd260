#pragma once
#include "tdb/breakpoints.hpp"
#include "tdb/command.hpp"
#include "tdb/error_codes.hpp"
#include "tdb/symbols.hpp"
#include "tdb/target.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tdb::debugger {

using launcher = std::function<
    tl::expected<std::unique_ptr<target::controller>, error::launch>(
        const std::string& path,
        const std::vector<std::string>& args
    )
>;

// Starts targets with target::ptrace_controller::spawn.
[[nodiscard]]
auto ptrace_launcher() -> launcher;

// One debugging session over one program. Owns the breakpoint table and, while
// a target is alive, the only handle to it. Every command is handled to
// completion before the next one is read, and every per command failure is
// reported on out and never leaves the session.
class session {
public:
    session(
        std::string program,
        std::vector<std::string> default_args,
        std::unique_ptr<symbols::resolver> resolver,
        launcher launch,
        std::FILE* out = stdout
    );

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    // Reads commands with linenoise until quit or end of input. history_path
    // is loaded at start when it exists and rewritten after every command.
    auto run(const std::optional<std::string>& history_path) -> void;

    // Handles one input line. Returns false once the session is over.
    auto execute(std::string_view line) -> bool;

    // Kills the target, if any. The breakpoints are kept.
    auto shutdown() -> void;

    [[nodiscard]] bool has_target() const { return target_ != nullptr; }
    [[nodiscard]] auto breakpoint_table() const -> const breakpoints::table& { return breakpoints_; }

private:
    auto run_target(const std::vector<std::string>& args) -> void;
    auto continue_target() -> void;
    auto print_backtrace() -> void;
    auto set_breakpoint(const std::vector<std::string>& args) -> void;
    auto kill_target() -> void;
    auto handle_register(const std::vector<std::string>& args) -> void;

    [[nodiscard]] auto resolve_breakpoint(std::string_view spec) -> std::optional<std::uintptr_t>;
    auto arm_breakpoints() -> void;
    auto report(const target::stop_status& status) -> void;
    auto print_location(std::uintptr_t address) -> void;
    auto discard_target() -> void;

    std::string program_;
    std::vector<std::string> default_args_;
    std::unique_ptr<symbols::resolver> resolver_;
    launcher launch_;
    std::FILE* out_;

    breakpoints::table breakpoints_;
    std::unique_ptr<target::controller> target_;

    // How the live target last stopped, empty without a target.
    std::optional<target::stop_status> last_stop_;
};

}
