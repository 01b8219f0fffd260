#include <array>
#include <cstdlib>
#include <filesystem>
namespace fs = std::filesystem;
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/std.h>

#include "tdb/debugger.hpp"
#include "tdb/error_codes.hpp"
#include "tdb/symbols.hpp"

// Only ELF files are accepted as debugees. They start with the bytes 0x7f,
// 'E', 'L', 'F' (see elf(5)).
static bool is_file_valid(const fs::path& program_path) {
    std::error_code ec;
    if(!fs::is_regular_file(program_path, ec) || ec) {
        return false;
    }

    std::ifstream executable(program_path, std::ios::binary);
    if(!executable) {
        fmt::print("Failed to open file {}.\n", program_path);
        return false;
    }

    std::array<char, 4> magic{};
    executable.read(magic.data(), magic.size());

    return executable.gcount() == static_cast<std::streamsize>(magic.size()) &&
           magic == std::array<char, 4>{0x7f, 'E', 'L', 'F'};
}

static std::optional<std::string> history_path() {
    const char* home = std::getenv("HOME");
    if(home == nullptr) {
        return std::nullopt;
    }

    return (fs::path(home) / ".tdb_history").string();
}

int main(int argc, const char** argv) {
    if(argc < 2) {
        fmt::print("Usage: {} <program> [args...]\n", argv[0]);
        return EXIT_FAILURE;
    }

    const fs::path program_path(argv[1]);
    if(!is_file_valid(program_path)) {
        fmt::print("The file {} does not exists or is not an ELF executable.\n", program_path);
        return EXIT_FAILURE;
    }

    auto resolver = tdb::symbols::dwarf_resolver::load(program_path.string());
    if(!resolver) {
        const auto& failure = resolver.error();
        if(failure.kind == tdb::error::symbols::open_fail) {
            fmt::print("Could not open file {}\n", program_path);
        } else {
            fmt::print("Could not read debugging symbols from {}: {}\n", program_path, failure.detail);
        }
        return EXIT_FAILURE;
    }

    std::vector<std::string> default_args(argv + 2, argv + argc);

    tdb::debugger::session session(
        program_path.string(),
        std::move(default_args),
        std::move(*resolver),
        tdb::debugger::ptrace_launcher()
    );

    session.run(history_path());

    return EXIT_SUCCESS;
}
