#include "tdb/backtrace.hpp"

#include <utility>

namespace tdb::backtrace {

auto walk(
    target::controller& target,
    const symbols::resolver& resolver,
    std::string_view entry_function
) -> tl::expected<std::vector<frame>, error::target> {
    const auto regs = target.read_registers();
    if(!regs) {
        return tl::make_unexpected(regs.error());
    }

    std::uintptr_t instruction_pointer = regs->instruction_pointer();
    std::uintptr_t frame_base = regs->frame_base();

    std::vector<frame> frames;

    while(frames.size() < max_frames) {
        auto function = resolver.function_for_address(instruction_pointer);
        const bool at_entry = function && *function == entry_function;
        const bool resolved = function.has_value();

        frames.push_back({
            instruction_pointer,
            std::move(function),
            resolver.line_for_address(instruction_pointer)
        });

        if(at_entry || !resolved || frame_base == 0) {
            break;
        }

        const auto return_address = target.read_word(frame_base + target::word_size);
        if(!return_address) {
            return tl::make_unexpected(return_address.error());
        }

        const auto caller_frame_base = target.read_word(frame_base);
        if(!caller_frame_base) {
            return tl::make_unexpected(caller_frame_base.error());
        }

        instruction_pointer = *return_address;
        frame_base = *caller_frame_base;
    }

    return frames;
}

}
