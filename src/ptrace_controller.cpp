#include "tdb/ptrace_controller.hpp"
#include "tdb/util.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <sys/personality.h>
#include <sys/ptrace.h>
#include <sys/user.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

[[noreturn]]
void execute_debugee(const char* path, char* const* argv) {
    // Breakpoints on raw addresses are only meaningful if the target is
    // loaded at the same place on every run.
    if(personality(ADDR_NO_RANDOMIZE) == -1) {
        tdb::util::print_error_message("personality", errno);
        std::_Exit(EXIT_FAILURE);
    }

    if(ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) == -1) {
        tdb::util::print_error_message("ptrace", errno);
        std::_Exit(EXIT_FAILURE);
    }

    execv(path, argv);

    // Only reached if execv failed.
    tdb::util::print_error_message("execv", errno);
    std::_Exit(EXIT_FAILURE);
}

auto waitpid_retrying(pid_t pid, int& wait_status, int options) -> pid_t {
    pid_t result = 0;
    do {
        result = waitpid(pid, &wait_status, options);
    } while(result == -1 && errno == EINTR);

    return result;
}

}

namespace tdb::target {

auto ptrace_controller::spawn(
    const std::string& path,
    const std::vector<std::string>& args
) -> tl::expected<std::unique_ptr<ptrace_controller>, error::launch> {
    // argv is built before forking so the child does nothing but exec.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(path.c_str()));
    for(const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();

    if(pid == -1) {
        util::print_error_message("fork", errno);
        return tl::make_unexpected(error::launch::fork_fail);
    }

    if(pid == 0) {
        execute_debugee(path.c_str(), argv.data());
    }

    std::unique_ptr<ptrace_controller> proc(new ptrace_controller(pid));

    const auto status = proc->wait(wait_mode::blocking);
    if(!status) {
        return tl::make_unexpected(error::launch::wait_fail);
    }

    const auto* stop = std::get_if<stopped>(&*status);
    if(stop == nullptr) {
        // The child exited before (or instead of) executing the program.
        return tl::make_unexpected(error::launch::exec_fail);
    }

    if(stop->signal != SIGTRAP) {
        return tl::make_unexpected(error::launch::unexpected_stop);
    }

    // If the debugger dies the target goes with it. Failing to set this only
    // loses that guarantee, the target is still fully usable.
    if(ptrace(PTRACE_SETOPTIONS, pid, nullptr, PTRACE_O_EXITKILL) == -1) {
        util::print_error_message("ptrace", errno);
    }

    return proc;
}

ptrace_controller::~ptrace_controller() {
    terminate();
}

auto ptrace_controller::wait(
    wait_mode mode
) -> tl::expected<stop_status, error::target> {
    if(final_status_) {
        return *final_status_;
    }

    int wait_status = 0;
    const int options = mode == wait_mode::nonblocking ? WNOHANG : 0;

    const pid_t result = waitpid_retrying(pid_, wait_status, options);

    if(result == -1) {
        util::print_error_message("waitpid", errno);
        return tl::make_unexpected(error::target::wait_fail);
    }

    if(result == 0) {
        return tl::make_unexpected(error::target::still_running);
    }

    if(WIFEXITED(wait_status)) {
        final_status_ = exited{WEXITSTATUS(wait_status)};
        return *final_status_;
    }

    if(WIFSIGNALED(wait_status)) {
        final_status_ = signaled{WTERMSIG(wait_status)};
        return *final_status_;
    }

    if(WIFSTOPPED(wait_status)) {
        const auto regs = read_registers();
        if(!regs) {
            return tl::make_unexpected(regs.error());
        }

        return stopped{WSTOPSIG(wait_status), regs->instruction_pointer()};
    }

    // Without WCONTINUED or extra ptrace options nothing else can come back
    // from waitpid. Guessing the state from here on could corrupt the target.
    fmt::print(
        stderr,
        "waitpid returned unexpected status {:#x} for pid {}\n",
        wait_status,
        pid_
    );
    std::abort();
}

auto ptrace_controller::read_registers(
) -> tl::expected<registers::snapshot, error::target> {
    if(final_status_) {
        return tl::make_unexpected(error::target::getregs_fail);
    }

    user_regs_struct regs;

    if(ptrace(PTRACE_GETREGS, pid_, nullptr, &regs) == -1) {
        util::print_error_message("ptrace", errno);
        return tl::make_unexpected(error::target::getregs_fail);
    }

    return registers::snapshot(regs);
}

auto ptrace_controller::write_registers(
    const registers::snapshot& regs
) -> tl::expected<void, error::target> {
    if(final_status_) {
        return tl::make_unexpected(error::target::setregs_fail);
    }

    user_regs_struct raw = regs.raw();

    if(ptrace(PTRACE_SETREGS, pid_, nullptr, &raw) == -1) {
        util::print_error_message("ptrace", errno);
        return tl::make_unexpected(error::target::setregs_fail);
    }

    return {};
}

auto ptrace_controller::read_word(
    std::uintptr_t address
) -> tl::expected<std::uint64_t, error::target> {
    if(address != align_to_word(address)) {
        return tl::make_unexpected(error::target::misaligned_address);
    }

    if(final_status_) {
        return tl::make_unexpected(error::target::peek_fail);
    }

    // PTRACE_PEEKDATA returns the word itself, so -1 is a valid value and does
    // not necessarily describe an error. errno is cleared before the call and
    // checked right after. More info at RETURN VALUE in ptrace(2).
    errno = 0;
    const long data = ptrace(PTRACE_PEEKDATA, pid_, reinterpret_cast<void*>(address), nullptr);
    if(data == -1 && errno != 0) {
        util::print_error_message("ptrace", errno);
        return tl::make_unexpected(error::target::peek_fail);
    }

    return static_cast<std::uint64_t>(data);
}

auto ptrace_controller::write_word(
    std::uintptr_t address,
    std::uint64_t value
) -> tl::expected<void, error::target> {
    if(address != align_to_word(address)) {
        return tl::make_unexpected(error::target::misaligned_address);
    }

    if(final_status_) {
        return tl::make_unexpected(error::target::poke_fail);
    }

    if(ptrace(
        PTRACE_POKEDATA,
        pid_,
        reinterpret_cast<void*>(address),
        reinterpret_cast<void*>(value)
    ) == -1) {
        util::print_error_message("ptrace", errno);
        return tl::make_unexpected(error::target::poke_fail);
    }

    return {};
}

// For resume and single_step an ESRCH means the process died under us (for
// example killed from outside). The next wait() reaps it and reports how it
// ended, so it is not treated as a failure here.
auto ptrace_controller::resume() -> tl::expected<void, error::target> {
    if(final_status_) {
        return {};
    }

    if(ptrace(PTRACE_CONT, pid_, nullptr, nullptr) == -1) {
        const int error_number = errno;
        if(error_number == ESRCH) {
            return {};
        }

        util::print_error_message("ptrace", error_number);
        return tl::make_unexpected(error::target::resume_fail);
    }

    return {};
}

auto ptrace_controller::single_step() -> tl::expected<void, error::target> {
    if(final_status_) {
        return {};
    }

    if(ptrace(PTRACE_SINGLESTEP, pid_, nullptr, nullptr) == -1) {
        const int error_number = errno;
        if(error_number == ESRCH) {
            return {};
        }

        util::print_error_message("ptrace", error_number);
        return tl::make_unexpected(error::target::step_fail);
    }

    return {};
}

auto ptrace_controller::terminate() -> bool {
    if(final_status_) {
        return false;
    }

    if(kill(pid_, SIGKILL) == -1) {
        // ESRCH: there is nothing left to kill or reap.
        final_status_ = signaled{SIGKILL};
        return false;
    }

    int wait_status = 0;
    while(true) {
        if(waitpid_retrying(pid_, wait_status, 0) == -1) {
            util::print_error_message("waitpid", errno);
            break;
        }

        if(WIFEXITED(wait_status)) {
            final_status_ = exited{WEXITSTATUS(wait_status)};
            return true;
        }

        if(WIFSIGNALED(wait_status)) {
            break;
        }
    }

    final_status_ = signaled{SIGKILL};
    return true;
}

}
