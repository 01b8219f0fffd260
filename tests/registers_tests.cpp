#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "tdb/registers.hpp"

using tdb::registers::reg;

TEST_CASE("Register names round trip", "[registers]") {
    for(const auto r : {reg::rax, reg::rbp, reg::rip, reg::eflags, reg::orig_rax, reg::gs_base}) {
        const auto parsed = tdb::registers::from_string(tdb::registers::to_string(r));
        REQUIRE(parsed);
        REQUIRE(*parsed == r);
    }

    const auto unknown = tdb::registers::from_string("xmm0");
    REQUIRE_FALSE(unknown);
    REQUIRE(unknown.error() == tdb::error::registers::unknown_reg_name);
}

TEST_CASE("Snapshots map registers to the right fields", "[registers]") {
    tdb::registers::snapshot regs;

    regs.set(reg::rip, 0x401136);
    regs.set(reg::rbp, 0x7fffffffe000);
    regs.set(reg::r12, 42);

    REQUIRE(regs.instruction_pointer() == 0x401136);
    REQUIRE(regs.raw().rip == 0x401136);
    REQUIRE(regs.frame_base() == 0x7fffffffe000);
    REQUIRE(regs.value(reg::r12) == 42);
    REQUIRE(regs.value(reg::r13) == 0);

    regs.set_instruction_pointer(0x401135);
    REQUIRE(regs.value(reg::rip) == 0x401135);
}

TEST_CASE("Register dump lists every register", "[registers]") {
    using Catch::Matchers::ContainsSubstring;

    tdb::registers::snapshot regs;
    regs.set(reg::rip, 0x401136);

    const std::string dump = tdb::registers::format(regs);

    REQUIRE_THAT(dump, ContainsSubstring("rip:      0x0000000000401136"));
    REQUIRE_THAT(dump, ContainsSubstring("orig_rax: 0x0000000000000000"));
}
