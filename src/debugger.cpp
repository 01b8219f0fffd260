#include "tdb/debugger.hpp"
#include "tdb/backtrace.hpp"
#include "tdb/execution.hpp"
#include "tdb/ptrace_controller.hpp"
#include "tdb/registers.hpp"
#include "tdb/util.hpp"

#include <linenoise.h>
#include <fmt/core.h>
#include <tl/expected.hpp>

#include <cerrno>
#include <utility>

namespace {

auto split_line_spec(
    std::string_view spec
) -> std::pair<std::optional<std::string_view>, std::optional<unsigned>> {
    if(const auto line = tdb::util::parse_decimal(spec)) {
        return {std::nullopt, line};
    }

    // file:line. A "::" belongs to a qualified function name, not to a file.
    const auto colon = spec.rfind(':');
    if(colon == std::string_view::npos || colon == 0 || spec[colon - 1] == ':') {
        return {std::nullopt, std::nullopt};
    }

    const auto line = tdb::util::parse_decimal(spec.substr(colon + 1));
    if(!line) {
        return {std::nullopt, std::nullopt};
    }

    return {spec.substr(0, colon), line};
}

}

namespace tdb::debugger {

auto ptrace_launcher() -> launcher {
    return [](const std::string& path, const std::vector<std::string>& args)
        -> tl::expected<std::unique_ptr<target::controller>, error::launch> {
        return target::ptrace_controller::spawn(path, args)
            .map([](auto&& proc) -> std::unique_ptr<target::controller> {
                return std::move(proc);
            });
    };
}

session::session(
    std::string program,
    std::vector<std::string> default_args,
    std::unique_ptr<symbols::resolver> resolver,
    launcher launch,
    std::FILE* out
) : program_(std::move(program)),
    default_args_(std::move(default_args)),
    resolver_(std::move(resolver)),
    launch_(std::move(launch)),
    out_(out) {}

auto session::run(const std::optional<std::string>& history_path) -> void {
    if(history_path) {
        // A missing or unreadable history file just means an empty history.
        static_cast<void>(linenoiseHistoryLoad(history_path->c_str()));
    }

    while(true) {
        errno = 0;
        char* line = linenoise("(tdb) ");

        if(line == nullptr) {
            // linenoise reports Ctrl-C as a null line with EAGAIN.
            if(errno == EAGAIN) {
                fmt::print(out_, "Type \"quit\" to exit\n");
                continue;
            }

            break;
        }

        const std::string input(line);
        linenoiseFree(line);

        if(util::split(input, ' ').empty()) {
            continue;
        }

        linenoiseHistoryAdd(input.c_str());
        if(history_path && linenoiseHistorySave(history_path->c_str()) == -1) {
            fmt::print(out_, "Warning: failed to save history file at {}\n", *history_path);
        }

        if(!execute(input)) {
            return;
        }
    }

    // End of input counts as quit.
    shutdown();
}

auto session::execute(std::string_view line) -> bool {
    const auto cmd = command::parse(line);

    if(!cmd) {
        if(!util::split(line, ' ').empty()) {
            fmt::print(out_, "Unrecognized command.\n");
        }
        return true;
    }

    switch(cmd->type) {
    case command::kind::run:
        run_target(cmd->args.empty() ? default_args_ : cmd->args);
        break;
    case command::kind::cont:
        continue_target();
        break;
    case command::kind::backtrace:
        print_backtrace();
        break;
    case command::kind::breakpoint:
        set_breakpoint(cmd->args);
        break;
    case command::kind::kill:
        kill_target();
        break;
    case command::kind::registers:
        handle_register(cmd->args);
        break;
    case command::kind::quit:
        shutdown();
        return false;
    }

    return true;
}

auto session::shutdown() -> void {
    if(target_) {
        kill_target();
    }
}

auto session::run_target(const std::vector<std::string>& args) -> void {
    if(target_) {
        kill_target();
    }

    auto spawned = launch_(program_, args);
    if(!spawned) {
        fmt::print(out_, "Error starting subprocess: {}.\n", error::to_string(spawned.error()));
        return;
    }

    target_ = std::move(*spawned);

    // Nothing may run in the new process before every breakpoint is in place.
    arm_breakpoints();
    continue_target();
}

auto session::continue_target() -> void {
    if(!target_) {
        fmt::print(out_, "The program is not running.\n");
        return;
    }

    const auto status = execution::continue_execution(*target_, breakpoints_);
    if(!status) {
        fmt::print(out_, "Failed to continue: {}.\n", error::to_string(status.error()));
        return;
    }

    report(*status);
}

auto session::print_backtrace() -> void {
    if(!target_) {
        fmt::print(out_, "The program is not running.\n");
        return;
    }

    auto frames = backtrace::walk(*target_, *resolver_);
    if(!frames) {
        fmt::print(out_, "Backtrace failed: {}.\n", error::to_string(frames.error()));
        return;
    }

    // Stopped on a trap the instruction pointer is one past it. Frame #0 shows
    // the breakpoint itself, as the stop report does.
    if(last_stop_ && !frames->empty()) {
        if(const auto hit = execution::breakpoint_hit(*last_stop_, breakpoints_)) {
            frames->front().address = *hit;
        }
    }

    for(std::size_t i = 0; i < frames->size(); ++i) {
        const auto& frame = (*frames)[i];
        const std::string function = frame.function.value_or("??");

        if(frame.line) {
            fmt::print(out_, "#{} {:#x} in {} ({})\n", i, frame.address, function, symbols::to_string(*frame.line));
        } else {
            fmt::print(out_, "#{} {:#x} in {}\n", i, frame.address, function);
        }
    }
}

auto session::set_breakpoint(const std::vector<std::string>& args) -> void {
    if(args.empty()) {
        fmt::print(out_, "Missing argument for break command.\n");
        return;
    }

    if(args.size() > 1) {
        fmt::print(out_, "Too many arguments for break command.\n");
        return;
    }

    const auto address = resolve_breakpoint(args[0]);
    if(!address) {
        return;
    }

    const auto result = breakpoints_.register_address(*address);
    if(result.status == breakpoints::registration_status::already_registered) {
        fmt::print(out_, "Breakpoint {} already set at {:#x}.\n", result.id, *address);
        return;
    }

    fmt::print(out_, "Set breakpoint {} at {:#x}\n", result.id, *address);

    if(target_) {
        arm_breakpoints();
    }
}

// Precedence: a 0x literal (optionally written *0x...) is an address, then a
// line spec ("12" or "file.cpp:12") is looked up as a line, then the whole
// token is looked up as a function name.
auto session::resolve_breakpoint(std::string_view spec) -> std::optional<std::uintptr_t> {
    std::string_view literal = spec;
    if(!literal.empty() && literal[0] == '*') {
        literal.remove_prefix(1);
    }

    if(util::is_prefix("0x", literal) || util::is_prefix("0X", literal)) {
        const auto address = util::parse_hex(literal);
        if(!address) {
            fmt::print(out_, "Invalid address {}: {}.\n", spec, error::to_string(address.error()));
            return std::nullopt;
        }

        return static_cast<std::uintptr_t>(*address);
    }

    const auto [module_hint, line] = split_line_spec(spec);

    if(line) {
        if(const auto address = resolver_->address_for_line(module_hint, *line)) {
            return address;
        }
    }

    if(const auto address = resolver_->address_for_function(std::nullopt, spec)) {
        return address;
    }

    fmt::print(out_, "No such line or function {}\n", spec);
    return std::nullopt;
}

auto session::kill_target() -> void {
    if(!target_) {
        fmt::print(out_, "The program is not running.\n");
        return;
    }

    const pid_t pid = target_->pid();
    if(target_->terminate()) {
        fmt::print(out_, "Killing running inferior (pid {})\n", pid);
    }

    discard_target();
}

auto session::handle_register(const std::vector<std::string>& args) -> void {
    if(!target_) {
        fmt::print(out_, "The program is not running.\n");
        return;
    }

    auto regs = target_->read_registers();
    if(!regs) {
        fmt::print(out_, "Unable to retrieve register values: {}.\n", error::to_string(regs.error()));
        return;
    }

    if(args.size() == 1 && args[0] == "dump") {
        fmt::print(out_, "{}", registers::format(*regs));
    } else if(args.size() == 2 && args[0] == "read") {
        const auto reg = registers::from_string(args[1]);
        if(!reg) {
            fmt::print(out_, "Unknown register name {}\n", args[1]);
            return;
        }

        fmt::print(out_, "{} = {:#018x}\n", args[1], regs->value(*reg));
    } else if(args.size() == 3 && args[0] == "write") {
        const auto reg = registers::from_string(args[1]);
        if(!reg) {
            fmt::print(out_, "Unknown register name {}\n", args[1]);
            return;
        }

        const auto value = util::parse_hex(args[2]);
        if(!value) {
            fmt::print(out_, "Invalid value {}: {}.\n", args[2], error::to_string(value.error()));
            return;
        }

        regs->set(*reg, *value);
        const auto written = target_->write_registers(*regs);
        if(!written) {
            fmt::print(out_, "Failed to set the value for the register {}: {}.\n", args[1], error::to_string(written.error()));
            return;
        }

        // A moved instruction pointer is no longer sitting after a trap.
        if(*reg == registers::reg::rip) {
            last_stop_.reset();
        }
    } else {
        fmt::print(out_, "Usage: register dump | read <reg> | write <reg> <0xvalue>\n");
    }
}

auto session::arm_breakpoints() -> void {
    for(const auto address : breakpoints_.arm_all(*target_)) {
        fmt::print(out_, "Failed to arm breakpoint at {:#x}.\n", address);
    }
}

auto session::report(const target::stop_status& status) -> void {
    if(const auto* stop = std::get_if<target::stopped>(&status)) {
        last_stop_ = status;
        fmt::print(out_, "Child stopped (signal {})\n", util::signal_name(stop->signal));

        const auto hit = execution::breakpoint_hit(status, breakpoints_);
        if(hit) {
            const auto* bp = breakpoints_.find(*hit);
            fmt::print(out_, "Hit breakpoint {} at {:#x}\n", bp->id, *hit);
        }

        print_location(hit.value_or(stop->instruction_pointer));
        return;
    }

    if(const auto* finished = std::get_if<target::exited>(&status)) {
        fmt::print(out_, "Child exited (status {})\n", finished->status);
    } else if(const auto* killed = std::get_if<target::signaled>(&status)) {
        fmt::print(out_, "Child killed by signal {}\n", util::signal_name(killed->signal));
    }

    discard_target();
}

auto session::print_location(std::uintptr_t address) -> void {
    const auto function = resolver_->function_for_address(address);
    const auto line = resolver_->line_for_address(address);

    if(function && line) {
        fmt::print(out_, "Stopped at {} ({})\n", *function, symbols::to_string(*line));
    } else if(function) {
        fmt::print(out_, "Stopped at {}\n", *function);
    } else if(line) {
        fmt::print(out_, "Stopped at {}\n", symbols::to_string(*line));
    }
}

// The process image the breakpoints were armed in is gone; they get armed
// again in the next target.
auto session::discard_target() -> void {
    target_.reset();
    last_stop_.reset();
    breakpoints_.disarm_for_restart();
}

}
