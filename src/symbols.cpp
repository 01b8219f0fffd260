#include "tdb/symbols.hpp"
#include "tdb/util.hpp"

#include <elf/elf++.hh>
#include <fmt/core.h>

#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <stdexcept>

namespace {

// Subprograms can sit below namespaces and classes, not only directly under
// the compilation unit.
bool is_scope(const dwarf::die& die) {
    return die.tag == dwarf::DW_TAG::namespace_ ||
           die.tag == dwarf::DW_TAG::class_type ||
           die.tag == dwarf::DW_TAG::structure_type;
}

// Prototypes and in-class member declarations are subprograms too, but they
// describe no code and have no pc range to ask about.
bool has_code(const dwarf::die& die) {
    return die.has(dwarf::DW_AT::low_pc) || die.has(dwarf::DW_AT::ranges);
}

// Out of class member definitions carry their name on the declaration they
// point to with DW_AT_specification.
auto name_of(const dwarf::die& die) -> std::optional<std::string> {
    if(die.has(dwarf::DW_AT::name)) {
        return dwarf::at_name(die);
    }

    if(die.has(dwarf::DW_AT::specification)) {
        const dwarf::die declaration = die[dwarf::DW_AT::specification].as_reference();
        if(declaration.has(dwarf::DW_AT::name)) {
            return dwarf::at_name(declaration);
        }
    }

    return std::nullopt;
}

template<typename Predicate>
auto find_subprogram(
    const dwarf::die& parent,
    const Predicate& matches
) -> std::optional<dwarf::die> {
    for(const auto& die : parent) {
        if(die.tag == dwarf::DW_TAG::subprogram && matches(die)) {
            return die;
        }

        if(is_scope(die)) {
            auto nested = find_subprogram(die, matches);
            if(nested) {
                return nested;
            }
        }
    }

    return std::nullopt;
}

bool module_matches(
    std::optional<std::string_view> module_hint,
    const std::string& name
) {
    return !module_hint || tdb::util::is_path_suffix(*module_hint, name);
}

auto unit_name(const dwarf::compilation_unit& compilation_unit) -> std::optional<std::string> {
    const auto& root = compilation_unit.root();
    if(!root.has(dwarf::DW_AT::name)) {
        return std::nullopt;
    }

    return dwarf::at_name(root);
}

// libelfin throws format_error on malformed data and out_of_range when an
// attribute it was asked for is missing. Either way the lookup finds nothing.
template<typename Lookup>
auto guarded(const Lookup& lookup) -> decltype(lookup()) {
    try {
        return lookup();
    } catch(const dwarf::format_error& e) {
        fmt::print(stderr, "Malformed debugging information: {}\n", e.what());
    } catch(const std::out_of_range& e) {
        fmt::print(stderr, "Incomplete debugging information: {}\n", e.what());
    }

    return std::nullopt;
}

}

namespace tdb::symbols {

auto to_string(const line_descriptor& line) -> std::string {
    return fmt::format("{}:{}", line.file, line.line);
}

auto dwarf_resolver::load(
    const std::string& path
) -> tl::expected<std::unique_ptr<dwarf_resolver>, error::symbols_failure> {
    const int fd = open(path.c_str(), O_RDONLY);
    if(fd == -1) {
        util::print_error_message("open", errno);
        return tl::make_unexpected(error::symbols_failure{error::symbols::open_fail, {}});
    }

    // libelfin reports malformed or missing sections by throwing; the mmap
    // loader takes ownership of fd.
    try {
        elf::elf elf_file(elf::create_mmap_loader(fd));
        dwarf::dwarf dwarf_data(dwarf::elf::create_loader(elf_file));

        return std::unique_ptr<dwarf_resolver>(new dwarf_resolver(std::move(dwarf_data)));
    } catch(const std::exception& e) {
        return tl::make_unexpected(error::symbols_failure{error::symbols::format_error, e.what()});
    }
}

auto dwarf_resolver::line_for_address(
    std::uintptr_t address
) const -> std::optional<line_descriptor> {
    return guarded([&]() -> std::optional<line_descriptor> {
        for(const auto& compilation_unit : dwarf_.compilation_units()) {
            const auto& root = compilation_unit.root();
            if(!has_code(root) || !dwarf::die_pc_range(root).contains(address)) {
                continue;
            }

            const auto& line_table = compilation_unit.get_line_table();
            const auto entry = line_table.find_address(address);
            if(entry == line_table.end()) {
                return std::nullopt;
            }

            return line_descriptor{entry->file->path, entry->line};
        }

        return std::nullopt;
    });
}

auto dwarf_resolver::function_for_address(
    std::uintptr_t address
) const -> std::optional<std::string> {
    return guarded([&]() -> std::optional<std::string> {
        for(const auto& compilation_unit : dwarf_.compilation_units()) {
            const auto& root = compilation_unit.root();
            if(!has_code(root) || !dwarf::die_pc_range(root).contains(address)) {
                continue;
            }

            const auto function = find_subprogram(
                root,
                [address](const dwarf::die& die) {
                    return has_code(die) && dwarf::die_pc_range(die).contains(address);
                }
            );

            if(function) {
                return name_of(*function);
            }
        }

        return std::nullopt;
    });
}

// Only rows of the unit's own source file count. Rows of inlined header code
// carry line numbers of the header.
auto dwarf_resolver::address_for_line(
    std::optional<std::string_view> module_hint,
    unsigned line
) const -> std::optional<std::uintptr_t> {
    return guarded([&]() -> std::optional<std::uintptr_t> {
        for(const auto& compilation_unit : dwarf_.compilation_units()) {
            const auto name = unit_name(compilation_unit);
            if(!name || !module_matches(module_hint, *name)) {
                continue;
            }

            for(const auto& entry : compilation_unit.get_line_table()) {
                if(entry.is_stmt && !entry.end_sequence && entry.line == line &&
                   util::is_path_suffix(*name, entry.file->path)) {
                    return entry.address;
                }
            }
        }

        return std::nullopt;
    });
}

auto dwarf_resolver::address_for_function(
    std::optional<std::string_view> module_hint,
    std::string_view name
) const -> std::optional<std::uintptr_t> {
    return guarded([&]() -> std::optional<std::uintptr_t> {
        for(const auto& compilation_unit : dwarf_.compilation_units()) {
            if(module_hint) {
                const auto unit = unit_name(compilation_unit);
                if(!unit || !module_matches(module_hint, *unit)) {
                    continue;
                }
            }

            const auto function = find_subprogram(
                compilation_unit.root(),
                [name](const dwarf::die& die) {
                    const auto die_name = name_of(die);
                    return die_name && *die_name == name && die.has(dwarf::DW_AT::low_pc);
                }
            );

            if(function) {
                return dwarf::at_low_pc(*function);
            }
        }

        return std::nullopt;
    });
}

}
