#include "tdb/registers.hpp"

#include <fmt/format.h>

#include <array>
#include <iterator>
#include <utility>

namespace {

using tdb::registers::reg;

const std::array<std::pair<reg, std::string_view>, 27> reg_names = {{
    {reg::rax,      "rax"},
    {reg::rbx,      "rbx"},
    {reg::rcx,      "rcx"},
    {reg::rdx,      "rdx"},
    {reg::rdi,      "rdi"},
    {reg::rsi,      "rsi"},
    {reg::rbp,      "rbp"},
    {reg::rsp,      "rsp"},
    {reg::r8,       "r8"},
    {reg::r9,       "r9"},
    {reg::r10,      "r10"},
    {reg::r11,      "r11"},
    {reg::r12,      "r12"},
    {reg::r13,      "r13"},
    {reg::r14,      "r14"},
    {reg::r15,      "r15"},
    {reg::rip,      "rip"},
    {reg::eflags,   "eflags"},
    {reg::cs,       "cs"},
    {reg::orig_rax, "orig_rax"},
    {reg::fs_base,  "fs_base"},
    {reg::gs_base,  "gs_base"},
    {reg::fs,       "fs"},
    {reg::gs,       "gs"},
    {reg::ss,       "ss"},
    {reg::ds,       "ds"},
    {reg::es,       "es"},
}};

// Every accessor below goes through this so that reads and writes can never
// disagree on which field of user_regs_struct a register lives in.
[[nodiscard]]
auto field(user_regs_struct& regs, reg r) -> unsigned long long& {
    switch (r) {
    case reg::rax:      return regs.rax;
    case reg::rbx:      return regs.rbx;
    case reg::rcx:      return regs.rcx;
    case reg::rdx:      return regs.rdx;
    case reg::rdi:      return regs.rdi;
    case reg::rsi:      return regs.rsi;
    case reg::rbp:      return regs.rbp;
    case reg::rsp:      return regs.rsp;
    case reg::r8:       return regs.r8;
    case reg::r9:       return regs.r9;
    case reg::r10:      return regs.r10;
    case reg::r11:      return regs.r11;
    case reg::r12:      return regs.r12;
    case reg::r13:      return regs.r13;
    case reg::r14:      return regs.r14;
    case reg::r15:      return regs.r15;
    case reg::rip:      return regs.rip;
    case reg::eflags:   return regs.eflags;
    case reg::cs:       return regs.cs;
    case reg::orig_rax: return regs.orig_rax;
    case reg::fs_base:  return regs.fs_base;
    case reg::gs_base:  return regs.gs_base;
    case reg::fs:       return regs.fs;
    case reg::gs:       return regs.gs;
    case reg::ss:       return regs.ss;
    case reg::ds:       return regs.ds;
    case reg::es:       return regs.es;
    }

    return regs.rax;
}

}

namespace tdb::registers {

auto snapshot::value(reg r) const -> std::uint64_t {
    user_regs_struct copy = regs_;
    return field(copy, r);
}

auto snapshot::set(reg r, std::uint64_t value) -> void {
    field(regs_, r) = value;
}

auto to_string(reg r) -> std::string {
    for(const auto& [known, name] : reg_names) {
        if(known == r) {
            return std::string(name);
        }
    }

    return "unknown";
}

auto from_string(
    std::string_view reg_str
) -> tl::expected<reg, error::registers> {
    for(const auto& [r, name] : reg_names) {
        if(name == reg_str) {
            return r;
        }
    }

    return tl::make_unexpected(error::registers::unknown_reg_name);
}

auto format(const snapshot& regs) -> std::string {
    fmt::memory_buffer out;

    for(const auto& [r, name] : reg_names) {
        fmt::format_to(
            std::back_inserter(out),
            "{:<9} {:#018x}\n",
            fmt::format("{}:", name),
            regs.value(r)
        );
    }

    return fmt::to_string(out);
}

}
