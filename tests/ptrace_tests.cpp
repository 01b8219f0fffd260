#include <catch2/catch_test_macros.hpp>

#include "tdb/backtrace.hpp"
#include "tdb/breakpoints.hpp"
#include "tdb/execution.hpp"
#include "tdb/ptrace_controller.hpp"
#include "tdb/symbols.hpp"

#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

// These run the real nested_calls program under ptrace.

namespace {

const std::string target_path = TDB_TEST_TARGET;

auto spawn_target() -> std::unique_ptr<tdb::target::ptrace_controller> {
    auto spawned = tdb::target::ptrace_controller::spawn(target_path, {});
    REQUIRE(spawned);
    return std::move(*spawned);
}

auto load_symbols() -> std::unique_ptr<tdb::symbols::dwarf_resolver> {
    auto resolver = tdb::symbols::dwarf_resolver::load(target_path);
    REQUIRE(resolver);
    return std::move(*resolver);
}

}

TEST_CASE("Spawned targets stop before their first instruction", "[ptrace]") {
    auto target = spawn_target();
    const auto resolver = load_symbols();

    const auto main_address = resolver->address_for_function(std::nullopt, "main");
    REQUIRE(main_address);

    const auto regs = target->read_registers();
    REQUIRE(regs);
    REQUIRE(regs->instruction_pointer() != *main_address);

    SECTION("A patched byte reads back and restores cleanly") {
        const auto before = target->read_word(tdb::target::align_to_word(*main_address));
        REQUIRE(before);

        const auto old = target->patch_byte(*main_address, tdb::target::trap_opcode);
        REQUIRE(old);

        const auto patched = target->patch_byte(*main_address, *old);
        REQUIRE(patched);
        REQUIRE(*patched == tdb::target::trap_opcode);

        const auto after = target->read_word(tdb::target::align_to_word(*main_address));
        REQUIRE(after);
        REQUIRE(*after == *before);
    }

    SECTION("Terminating twice only kills once") {
        REQUIRE(target->terminate());
        REQUIRE_FALSE(target->terminate());
    }
}

TEST_CASE("Spawning a missing program fails", "[ptrace]") {
    const auto spawned = tdb::target::ptrace_controller::spawn("/nonexistent/tdb-test-program", {});

    REQUIRE_FALSE(spawned);
    REQUIRE(spawned.error() == tdb::error::launch::exec_fail);
}

TEST_CASE("A breakpoint at main is hit once and the program exits", "[ptrace]") {
    auto target = spawn_target();
    const auto resolver = load_symbols();
    tdb::breakpoints::table table;

    const auto main_address = resolver->address_for_function(std::nullopt, "main");
    REQUIRE(main_address);

    table.register_address(*main_address);
    REQUIRE(table.arm_all(*target).empty());

    const auto first = tdb::execution::continue_execution(*target, table);
    REQUIRE(first);
    REQUIRE(std::holds_alternative<tdb::target::stopped>(*first));
    REQUIRE(std::get<tdb::target::stopped>(*first).signal == SIGTRAP);
    REQUIRE(tdb::execution::breakpoint_hit(*first, table) == *main_address);

    const auto second = tdb::execution::continue_execution(*target, table);
    REQUIRE(second);
    REQUIRE(std::holds_alternative<tdb::target::exited>(*second));
    REQUIRE(std::get<tdb::target::exited>(*second).status == 0);

    REQUIRE_FALSE(target->terminate());
}

TEST_CASE("Backtrace from a nested call reaches main", "[ptrace]") {
    auto target = spawn_target();
    const auto resolver = load_symbols();
    tdb::breakpoints::table table;

    const auto address = resolver->address_for_line("nested_calls.cpp", 4);
    REQUIRE(address);
    REQUIRE(resolver->function_for_address(*address) == "leaf");

    table.register_address(*address);
    REQUIRE(table.arm_all(*target).empty());

    const auto status = tdb::execution::continue_execution(*target, table);
    REQUIRE(status);
    REQUIRE(tdb::execution::breakpoint_hit(*status, table) == *address);

    const auto frames = tdb::backtrace::walk(*target, *resolver);
    REQUIRE(frames);
    REQUIRE(frames->size() == 3);
    REQUIRE((*frames)[0].function == "leaf");
    REQUIRE((*frames)[1].function == "middle");
    REQUIRE((*frames)[2].function == "main");

    REQUIRE((*frames)[0].line);
    REQUIRE((*frames)[0].line->line == 4);
}
