#include "tdb/target.hpp"

namespace tdb::target {

auto controller::patch_byte(
    std::uintptr_t address,
    std::uint8_t value
) -> tl::expected<std::uint8_t, error::target> {
    const std::uintptr_t aligned = align_to_word(address);
    const unsigned shift = 8 * static_cast<unsigned>(address - aligned);

    const auto word = read_word(aligned);
    if(!word) {
        return tl::make_unexpected(word.error());
    }

    const auto old_byte = static_cast<std::uint8_t>((*word >> shift) & 0xff);
    const std::uint64_t mask = std::uint64_t{0xff} << shift;
    const std::uint64_t patched = (*word & ~mask) | (std::uint64_t{value} << shift);

    const auto written = write_word(aligned, patched);
    if(!written) {
        return tl::make_unexpected(written.error());
    }

    return old_byte;
}

}
