#include <catch2/catch_test_macros.hpp>

#include "tdb/command.hpp"

using tdb::command::kind;
using tdb::command::parse;

TEST_CASE("Commands are matched by prefix", "[command]") {
    SECTION("Full names") {
        REQUIRE(parse("run")->type == kind::run);
        REQUIRE(parse("continue")->type == kind::cont);
        REQUIRE(parse("backtrace")->type == kind::backtrace);
        REQUIRE(parse("break main")->type == kind::breakpoint);
        REQUIRE(parse("kill")->type == kind::kill);
        REQUIRE(parse("register dump")->type == kind::registers);
        REQUIRE(parse("quit")->type == kind::quit);
    }

    SECTION("Short forms") {
        REQUIRE(parse("r")->type == kind::run);
        REQUIRE(parse("c")->type == kind::cont);
        REQUIRE(parse("cont")->type == kind::cont);
        REQUIRE(parse("b 0x40")->type == kind::breakpoint);
        REQUIRE(parse("bt")->type == kind::backtrace);
        REQUIRE(parse("back")->type == kind::backtrace);
        REQUIRE(parse("reg dump")->type == kind::registers);
        REQUIRE(parse("q")->type == kind::quit);
    }
}

TEST_CASE("Command arguments are kept in order", "[command]") {
    const auto cmd = parse("  run   first  second ");

    REQUIRE(cmd);
    REQUIRE(cmd->type == kind::run);
    REQUIRE(cmd->args == std::vector<std::string>{"first", "second"});
}

TEST_CASE("Unknown and blank input is rejected", "[command]") {
    REQUIRE_FALSE(parse(""));
    REQUIRE_FALSE(parse("   "));
    REQUIRE_FALSE(parse("step"));
    REQUIRE_FALSE(parse("continuex"));
}
