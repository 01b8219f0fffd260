#pragma once
#include "tdb/error_codes.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tdb::util {

// Simple wrapper to format an error message on stderr. error_number should be
// a copy of errno right after the call that failed and before any other
// function call. For more detail see NOTES in errno(3).
void print_error_message(const char* procedure_name, int error_number);

// Returns an array of string_view containing the substrings delimited by a
// sequence of delimiter characters in O(source.size()) time. Runs of
// delimiters are skipped and never produce empty tokens.
//
// Example: split("  a   bb ", ' ') -> {"a", "bb"}
std::vector<std::string_view> split(std::string_view source, char delimiter);

// Check if prefix is a non empty prefix of full. That is, if full is equal to
// or starts with prefix.
bool is_prefix(std::string_view prefix, std::string_view full);

bool is_suffix(std::string_view suffix, std::string_view full);

// Like is_suffix, but only whole path components match: "calls.cpp" is a
// path suffix of "src/calls.cpp" and not of "src/nested_calls.cpp".
bool is_path_suffix(std::string_view suffix, std::string_view path);

// "SIGTRAP" for SIGTRAP. Unknown numbers come back as "signal <n>".
[[nodiscard]]
auto signal_name(int signal) -> std::string;

// Parses "0x1234" (or "0X1234"). The whole string has to be consumed.
[[nodiscard]]
auto parse_hex(std::string_view str) -> tl::expected<std::uint64_t, error::address>;

// Parses a plain unsigned decimal number, nullopt if str is anything else.
[[nodiscard]]
auto parse_decimal(std::string_view str) -> std::optional<unsigned>;

}
