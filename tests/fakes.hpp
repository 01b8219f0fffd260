#pragma once

#include "tdb/registers.hpp"
#include "tdb/symbols.hpp"
#include "tdb/target.hpp"
#include "tdb/util.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <cstdio>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tdb::testing {

// State of a pretend process. Shared between the test and the controller so
// that it can still be inspected after the session dropped the controller.
struct fake_process {
    std::map<std::uintptr_t, std::uint64_t> memory;
    registers::snapshot regs;

    // Statuses handed out by successive wait() calls.
    std::deque<target::stop_status> stops;

    // Every operation, in the order it was requested.
    std::vector<std::string> calls;

    // Byte under the instruction pointer each time single_step was called.
    std::vector<std::uint8_t> bytes_stepped;

    bool fail_setregs = false;
    bool terminated = false;

    void set_byte(std::uintptr_t address, std::uint8_t value) {
        const std::uintptr_t aligned = target::align_to_word(address);
        const unsigned shift = 8 * static_cast<unsigned>(address - aligned);
        std::uint64_t& word = memory[aligned];
        word = (word & ~(std::uint64_t{0xff} << shift)) | (std::uint64_t{value} << shift);
    }

    [[nodiscard]] std::uint8_t byte_at(std::uintptr_t address) const {
        const std::uintptr_t aligned = target::align_to_word(address);
        const unsigned shift = 8 * static_cast<unsigned>(address - aligned);
        return static_cast<std::uint8_t>((memory.at(aligned) >> shift) & 0xff);
    }

    [[nodiscard]] std::size_t count(const std::string& call) const {
        std::size_t n = 0;
        for(const auto& c : calls) {
            n += c == call ? 1 : 0;
        }
        return n;
    }
};

class fake_controller final : public target::controller {
public:
    explicit fake_controller(std::shared_ptr<fake_process> process)
        : process_(std::move(process)) {}

    [[nodiscard]] auto pid() const -> pid_t override { return 4242; }

    [[nodiscard]]
    auto wait(target::wait_mode) -> tl::expected<target::stop_status, error::target> override {
        process_->calls.push_back("wait");

        if(process_->stops.empty()) {
            return tl::make_unexpected(error::target::wait_fail);
        }

        const target::stop_status status = process_->stops.front();
        process_->stops.pop_front();

        if(const auto* stop = std::get_if<target::stopped>(&status)) {
            process_->regs.set_instruction_pointer(stop->instruction_pointer);
        }

        return status;
    }

    [[nodiscard]]
    auto read_registers() -> tl::expected<registers::snapshot, error::target> override {
        process_->calls.push_back("getregs");
        return process_->regs;
    }

    [[nodiscard]]
    auto write_registers(const registers::snapshot& regs) -> tl::expected<void, error::target> override {
        process_->calls.push_back("setregs");

        if(process_->fail_setregs) {
            return tl::make_unexpected(error::target::setregs_fail);
        }

        process_->regs = regs;
        return {};
    }

    [[nodiscard]]
    auto read_word(std::uintptr_t address) -> tl::expected<std::uint64_t, error::target> override {
        process_->calls.push_back("peek");

        if(address != target::align_to_word(address)) {
            return tl::make_unexpected(error::target::misaligned_address);
        }

        const auto word = process_->memory.find(address);
        if(word == process_->memory.end()) {
            return tl::make_unexpected(error::target::peek_fail);
        }

        return word->second;
    }

    [[nodiscard]]
    auto write_word(std::uintptr_t address, std::uint64_t value) -> tl::expected<void, error::target> override {
        process_->calls.push_back("poke");

        if(address != target::align_to_word(address)) {
            return tl::make_unexpected(error::target::misaligned_address);
        }

        const auto word = process_->memory.find(address);
        if(word == process_->memory.end()) {
            return tl::make_unexpected(error::target::poke_fail);
        }

        word->second = value;
        return {};
    }

    [[nodiscard]] auto resume() -> tl::expected<void, error::target> override {
        process_->calls.push_back("resume");
        return {};
    }

    [[nodiscard]] auto single_step() -> tl::expected<void, error::target> override {
        process_->calls.push_back("step");
        process_->bytes_stepped.push_back(process_->byte_at(process_->regs.instruction_pointer()));
        return {};
    }

    auto terminate() -> bool override {
        process_->calls.push_back("terminate");

        if(process_->terminated) {
            return false;
        }

        process_->terminated = true;
        return true;
    }

private:
    std::shared_ptr<fake_process> process_;
};

// A program made of functions laid out one after the other in prog.c, with a
// line table mapping line numbers to addresses.
class fake_resolver final : public symbols::resolver {
public:
    struct function {
        std::string name;
        std::uintptr_t low_pc;
        std::uintptr_t high_pc;
    };

    std::vector<function> functions;
    std::map<unsigned, std::uintptr_t> lines;
    std::string file = "prog.c";

    [[nodiscard]]
    auto line_for_address(std::uintptr_t address) const -> std::optional<symbols::line_descriptor> override {
        std::optional<symbols::line_descriptor> best;
        std::uintptr_t best_address = 0;

        for(const auto& [line, line_address] : lines) {
            if(line_address <= address && line_address >= best_address) {
                best = symbols::line_descriptor{file, line};
                best_address = line_address;
            }
        }

        return best;
    }

    [[nodiscard]]
    auto function_for_address(std::uintptr_t address) const -> std::optional<std::string> override {
        for(const auto& f : functions) {
            if(address >= f.low_pc && address < f.high_pc) {
                return f.name;
            }
        }

        return std::nullopt;
    }

    [[nodiscard]]
    auto address_for_line(
        std::optional<std::string_view> module_hint,
        unsigned line
    ) const -> std::optional<std::uintptr_t> override {
        if(module_hint && !util::is_path_suffix(*module_hint, file)) {
            return std::nullopt;
        }

        const auto it = lines.find(line);
        if(it == lines.end()) {
            return std::nullopt;
        }

        return it->second;
    }

    [[nodiscard]]
    auto address_for_function(
        std::optional<std::string_view>,
        std::string_view name
    ) const -> std::optional<std::uintptr_t> override {
        for(const auto& f : functions) {
            if(f.name == name) {
                return f.low_pc;
            }
        }

        return std::nullopt;
    }
};

// Collects whatever is written to a FILE* so that reports can be checked.
class captured_output {
public:
    captured_output() : file_(std::tmpfile()) {}
    ~captured_output() { std::fclose(file_); }

    captured_output(const captured_output&) = delete;
    captured_output& operator=(const captured_output&) = delete;

    [[nodiscard]] std::FILE* file() const { return file_; }

    [[nodiscard]] std::string str() const {
        std::fflush(file_);
        std::rewind(file_);

        std::string text;
        char buffer[256];
        std::size_t n = 0;
        while((n = std::fread(buffer, 1, sizeof(buffer), file_)) > 0) {
            text.append(buffer, n);
        }

        return text;
    }

private:
    std::FILE* file_;
};

}
