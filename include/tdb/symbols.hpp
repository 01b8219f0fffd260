#pragma once
#include "tdb/error_codes.hpp"

#include <dwarf/dwarf++.hh>
#include <tl/expected.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tdb::symbols {

struct line_descriptor {
    std::string file;
    unsigned line;
};

// "file:line"
[[nodiscard]]
auto to_string(const line_descriptor& line) -> std::string;

// Read-only symbolic lookups over the debugged program. module_hint, when
// given, restricts line and function lookups to compilation units whose name
// ends with it.
class resolver {
public:
    virtual ~resolver() = default;

    [[nodiscard]]
    virtual auto line_for_address(std::uintptr_t address) const -> std::optional<line_descriptor> = 0;

    [[nodiscard]]
    virtual auto function_for_address(std::uintptr_t address) const -> std::optional<std::string> = 0;

    [[nodiscard]]
    virtual auto address_for_line(
        std::optional<std::string_view> module_hint,
        unsigned line
    ) const -> std::optional<std::uintptr_t> = 0;

    [[nodiscard]]
    virtual auto address_for_function(
        std::optional<std::string_view> module_hint,
        std::string_view name
    ) const -> std::optional<std::uintptr_t> = 0;
};

// Resolver backed by the DWARF line and function tables of an ELF file.
class dwarf_resolver final : public resolver {
public:
    [[nodiscard]]
    static auto load(const std::string& path) -> tl::expected<std::unique_ptr<dwarf_resolver>, error::symbols_failure>;

    [[nodiscard]]
    auto line_for_address(std::uintptr_t address) const -> std::optional<line_descriptor> override;

    [[nodiscard]]
    auto function_for_address(std::uintptr_t address) const -> std::optional<std::string> override;

    [[nodiscard]]
    auto address_for_line(
        std::optional<std::string_view> module_hint,
        unsigned line
    ) const -> std::optional<std::uintptr_t> override;

    [[nodiscard]]
    auto address_for_function(
        std::optional<std::string_view> module_hint,
        std::string_view name
    ) const -> std::optional<std::uintptr_t> override;

private:
    explicit dwarf_resolver(dwarf::dwarf dwarf_data) : dwarf_(std::move(dwarf_data)) {}

    dwarf::dwarf dwarf_;
};

}
