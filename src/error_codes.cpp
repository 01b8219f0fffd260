#include "tdb/error_codes.hpp"

namespace tdb::error {

auto to_string(launch e) -> std::string_view {
    switch(e) {
    case launch::fork_fail:       return "could not fork the debugger";
    case launch::exec_fail:       return "could not execute the program";
    case launch::unexpected_stop: return "program did not stop with SIGTRAP after exec";
    case launch::wait_fail:       return "could not wait for the program to start";
    }

    return "unknown launch error";
}

auto to_string(target e) -> std::string_view {
    switch(e) {
    case target::peek_fail:          return "cannot read target memory";
    case target::poke_fail:          return "cannot write target memory";
    case target::misaligned_address: return "address is not word aligned";
    case target::getregs_fail:       return "cannot read target registers";
    case target::setregs_fail:       return "cannot write target registers";
    case target::resume_fail:        return "cannot resume target";
    case target::step_fail:          return "cannot single step target";
    case target::wait_fail:          return "cannot wait for target";
    case target::still_running:      return "target is still running";
    }

    return "unknown target error";
}

auto to_string(registers e) -> std::string_view {
    switch(e) {
    case registers::unknown_reg_name: return "unknown register name";
    }

    return "unknown register error";
}

auto to_string(address e) -> std::string_view {
    switch(e) {
    case address::malformed_address: return "malformed hexadecimal address";
    }

    return "unknown address error";
}

auto to_string(symbols e) -> std::string_view {
    switch(e) {
    case symbols::open_fail:    return "could not open file";
    case symbols::format_error: return "could not read debugging symbols";
    }

    return "unknown symbols error";
}

}
