#pragma once

#include "text.hpp"

#include "binmodel/symbol.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace binmodel::internal {

    using namespace std::string_view_literals;

    inline constexpr auto x86_64_file_format = "elf64-x86-64"sv;

    // objdump emits either "ret" or "retq" for the x86-64 opcode c3 depending on its
    // version (2.34 and 2.36.1 disagree for the same binary). Rewrites the last
    // "<ws>c3<ws>retq" to "ret" so instruction streams compare equal.
    inline std::string unify_x86_64_instruction_line(std::string_view line) {
        constexpr auto long_form = "retq"sv;

        auto pos = line.rfind(long_form);
        while (pos != std::string_view::npos) {
            auto before = line.substr(0U, pos);
            auto gap = before.size() - text::trim_right(before).size();
            if (gap > 0U) {
                auto opcode_end = before.size() - gap;
                if (opcode_end >= 3U && line.substr(opcode_end - 2U, 2U) == "c3"sv &&
                    text::ascii_is_space(line[opcode_end - 3U])) {
                    std::string unified{line.substr(0U, pos)};
                    unified.append("ret"sv);
                    unified.append(line.substr(pos + long_form.size()));
                    return unified;
                }
            }
            if (pos == 0U) {
                break;
            }
            pos = line.rfind(long_form, pos - 1U);
        }
        return std::string{line};
    }

    inline std::string normalize_instruction_line(const std::optional<std::string>& file_format, std::string_view line) {
        if (file_format && *file_format == x86_64_file_format) {
            return unify_x86_64_instruction_line(line);
        }
        return std::string{line};
    }

    // "0000000000001139 <main>:" (address optionally 0x-prefixed); yields the symbol name
    inline std::optional<std::string_view> parse_disassembly_header(std::string_view line) {
        if (line.starts_with("0x"sv) && text::span_of(line.substr(2U), text::ascii_is_hex_digit) > 0U) {
            line.remove_prefix(2U);
        }

        auto address_digits = text::span_of(line, text::ascii_is_hex_digit);
        if (address_digits == 0U) {
            return std::nullopt;
        }
        line.remove_prefix(address_digits);
        if (!line.starts_with(" <"sv)) {
            return std::nullopt;
        }
        line.remove_prefix(2U);

        auto end = line.rfind(">:"sv);
        if (end == std::string_view::npos || end == 0U) {
            return std::nullopt;
        }
        return line.substr(0U, end);
    }

    namespace detail {

        // Every token is a run of whole hex bytes: "48 89 e5" or "e59f3008".
        inline bool is_byte_column(std::string_view column) {
            auto tokens = text::split_whitespace_tokens(column);
            if (tokens.empty()) {
                return false;
            }
            return std::ranges::all_of(
                    tokens, [](std::string_view token) { return token.size() % 2U == 0U && text::is_hex_token(token); });
        }

        // Without tab separated columns: the longest run of hex byte pairs that is
        // followed by whitespace, then the instruction text.
        inline std::optional<std::string_view> parse_untabbed_instruction(std::string_view rest) {
            std::optional<size_t> bytes_end{};
            size_t i = 0U;
            while (true) {
                while (i < rest.size() && text::ascii_is_space(rest[i])) {
                    ++i;
                }
                if (i + 2U > rest.size() || !text::ascii_is_hex_digit(rest[i]) ||
                    !text::ascii_is_hex_digit(rest[i + 1U])) {
                    break;
                }
                i += 2U;
                if (i < rest.size() && text::ascii_is_space(rest[i])) {
                    bytes_end = i;
                }
            }

            if (!bytes_end) {
                return std::nullopt;
            }
            return text::trim_ascii(rest.substr(*bytes_end));
        }

    }  // namespace detail

    // "  1139:\t55                   \tpush   %rbp"; yields the instruction text
    inline std::optional<std::string_view> parse_disassembly_instruction(std::string_view line) {
        line = text::trim_left(line);
        auto address_digits = text::span_of(line, text::ascii_is_hex_digit);
        if (address_digits == 0U || address_digits >= line.size() || line[address_digits] != ':') {
            return std::nullopt;
        }
        auto rest = line.substr(address_digits + 1U);

        // objdump separates address, bytes and instruction with tabs
        auto lead = text::span_of(rest, text::ascii_is_space);
        if (rest.substr(0U, lead).find('\t') != std::string_view::npos) {
            auto columns = rest.substr(lead);
            auto tab = columns.find('\t');
            if (tab != std::string_view::npos && detail::is_byte_column(columns.substr(0U, tab))) {
                return text::trim_ascii(columns.substr(tab + 1U));
            }
        }

        return detail::parse_untabbed_instruction(rest);
    }

    /*
     * Walks `objdump -drwS` output and appends each known symbol's instructions.
     *
     * States:
     * - no_current_symbol: before the first header, or after a header naming a
     *   symbol that is not in the table; lines are dropped.
     * - in_current_symbol: instruction lines append their text, other non-blank
     *   lines append as tagged source lines.
     *
     * Headers never create symbols. The collector holds a reference to the table
     * and must not outlive it.
     */
    class disassembly_collector {
      public:
        enum class state : uint8_t { no_current_symbol, in_current_symbol };

        disassembly_collector(symbol_map& symbols, std::optional<std::string> file_format)
                : symbols{symbols}, file_format{std::move(file_format)} {}

        void parse(std::string_view objdump_output) {
            for (auto line : text::split_lines(objdump_output)) {
                consume_line(line);
            }
            finish();
        }

        void consume_line(std::string_view raw_line) {
            auto line = normalize_instruction_line(file_format, raw_line);

            if (auto name = parse_disassembly_header(line)) {
                leave_symbol();
                if (auto it = symbols.find(*name); it != symbols.end()) {
                    current = &it->second;
                    current_state = state::in_current_symbol;
                }
                return;
            }

            auto instruction = parse_disassembly_instruction(line);
            if (instruction) {
                ++instruction_lines;
            }

            if (current_state != state::in_current_symbol) {
                return;
            }

            if (instruction) {
                current->append_instruction(std::string{*instruction});
            }
            else if (!text::is_blank(line)) {
                current->append_instruction(tag_source_line(line));
            }
        }

        void finish() { leave_symbol(); }

        [[nodiscard]] state active_state() const noexcept { return current_state; }
        [[nodiscard]] const symbol* current_symbol() const noexcept { return current; }
        [[nodiscard]] size_t instruction_line_count() const noexcept { return instruction_lines; }

      private:
        void leave_symbol() {
            current = nullptr;
            current_state = state::no_current_symbol;
        }

        symbol_map& symbols;
        std::optional<std::string> file_format;
        symbol* current{nullptr};
        state current_state{state::no_current_symbol};
        size_t instruction_lines{};
    };

}  // namespace binmodel::internal
