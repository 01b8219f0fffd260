#include "tdb/util.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdio>
#include <cstring>

namespace tdb::util {

void print_error_message(const char* procedure_name, int error_number) {
    fmt::print(stderr, "{}: {}\n", procedure_name, std::strerror(error_number));
}

std::vector<std::string_view> split(std::string_view s, char delimiter) {
    std::vector<std::string_view> tokens;

    std::size_t begin = s.find_first_not_of(delimiter);
    while(begin != std::string_view::npos) {
        const std::size_t end = s.find(delimiter, begin);

        if(end == std::string_view::npos) {
            tokens.push_back(s.substr(begin));
            break;
        }

        tokens.push_back(s.substr(begin, end - begin));
        begin = s.find_first_not_of(delimiter, end);
    }

    return tokens;
}

bool is_prefix(std::string_view s, std::string_view of) {
    if(s.empty() || s.size() > of.size()) {
        return false;
    }

    return of.compare(0, s.size(), s) == 0;
}

bool is_suffix(std::string_view s, std::string_view of) {
    if(s.size() > of.size()) {
        return false;
    }

    return of.compare(of.size() - s.size(), s.size(), s) == 0;
}

bool is_path_suffix(std::string_view s, std::string_view path) {
    if(s.empty() || !is_suffix(s, path)) {
        return false;
    }

    return s.size() == path.size() || s.front() == '/' || path[path.size() - s.size() - 1] == '/';
}

auto signal_name(int signal) -> std::string {
    // glibc gives the abbreviation without the SIG prefix, or null for
    // numbers it does not know.
    const char* abbreviation = sigabbrev_np(signal);
    if(abbreviation == nullptr) {
        return fmt::format("signal {}", signal);
    }

    return fmt::format("SIG{}", abbreviation);
}

auto parse_hex(std::string_view str) -> tl::expected<std::uint64_t, error::address> {
    if(str.size() < 3 || str[0] != '0' || (str[1] != 'x' && str[1] != 'X')) {
        return tl::make_unexpected(error::address::malformed_address);
    }

    std::uint64_t value = 0;
    const char* last = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data() + 2, last, value, 16);

    if(ec != std::errc() || ptr != last) {
        return tl::make_unexpected(error::address::malformed_address);
    }

    return value;
}

auto parse_decimal(std::string_view str) -> std::optional<unsigned> {
    if(str.empty()) {
        return std::nullopt;
    }

    unsigned value = 0;
    const char* last = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), last, value, 10);

    if(ec != std::errc() || ptr != last) {
        return std::nullopt;
    }

    return value;
}

}
