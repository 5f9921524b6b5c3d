#pragma once

#include "text.hpp"

#include "binmodel/binary.hpp"
#include "binmodel/format.hpp"
#include "binmodel/log.hpp"
#include "binmodel/symbol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace binmodel::internal {

    using namespace binmodel::literals;
    using namespace std::string_view_literals;

    namespace dwarf {
        inline constexpr auto tag_compile_unit = "DW_TAG_compile_unit"sv;
        inline constexpr auto at_linkage_name = "DW_AT_linkage_name"sv;
        // pre-DWARF4 GCC spelling
        inline constexpr auto at_mips_linkage_name = "DW_AT_MIPS_linkage_name"sv;
        inline constexpr auto at_decl_file = "DW_AT_decl_file"sv;
        inline constexpr auto at_decl_line = "DW_AT_decl_line"sv;
        inline constexpr auto at_decl_column = "DW_AT_decl_column"sv;
        inline constexpr auto at_name = "DW_AT_name"sv;
    }  // namespace dwarf

    struct debug_info_header {
        uint64_t abbrev_number{};
        std::string_view tag{};
    };

    struct debug_info_attribute {
        std::string_view name{};
        std::string_view value{};
    };

    namespace detail {

        // "<2d>" at the front of `line`; returns the remainder
        inline std::optional<std::string_view> consume_offset(std::string_view line) {
            if (!line.starts_with('<')) {
                return std::nullopt;
            }
            auto digits = text::span_of(line.substr(1U), text::ascii_is_hex_digit);
            if (digits == 0U || line.size() < digits + 2U || line[digits + 1U] != '>') {
                return std::nullopt;
            }
            return line.substr(digits + 2U);
        }

    }  // namespace detail

    // " <1><2d>: Abbrev Number: 2 (DW_TAG_subprogram)"
    inline std::optional<debug_info_header> parse_debug_info_header(std::string_view line) {
        constexpr auto abbrev_marker = "Abbrev Number:"sv;

        auto rest = detail::consume_offset(text::trim_left(line));
        if (!rest) {
            return std::nullopt;
        }
        rest = detail::consume_offset(text::trim_left(*rest));
        if (!rest || !rest->starts_with(':')) {
            return std::nullopt;
        }
        rest->remove_prefix(1U);

        auto gap = text::span_of(*rest, text::ascii_is_space);
        if (gap == 0U || !rest->substr(gap).starts_with(abbrev_marker)) {
            return std::nullopt;
        }
        auto tail = text::trim_left(rest->substr(gap + abbrev_marker.size()));

        auto digits = text::span_of(tail, text::ascii_is_digit);
        auto abbrev_number = digits > 0U ? text::parse_u64(tail.substr(0U, digits)) : std::nullopt;
        if (!abbrev_number) {
            return std::nullopt;
        }
        tail.remove_prefix(digits);

        gap = text::span_of(tail, text::ascii_is_space);
        if (gap == 0U || gap >= tail.size() || tail[gap] != '(') {
            return std::nullopt;
        }
        tail.remove_prefix(gap + 1U);

        auto tag_size = text::span_of(tail, text::ascii_is_word);
        if (tag_size == 0U || tag_size >= tail.size() || tail[tag_size] != ')') {
            return std::nullopt;
        }
        return debug_info_header{.abbrev_number = *abbrev_number, .tag = tail.substr(0U, tag_size)};
    }

    // "    <2e>   DW_AT_decl_line   : 3"
    inline std::optional<debug_info_attribute> parse_debug_info_attribute(std::string_view line) {
        auto rest = detail::consume_offset(text::trim_left(line));
        if (!rest) {
            return std::nullopt;
        }

        auto gap = text::span_of(*rest, text::ascii_is_space);
        if (gap == 0U) {
            return std::nullopt;
        }
        rest->remove_prefix(gap);

        auto name_size = text::span_of(*rest, [](char c) { return !text::ascii_is_space(c) && c != ':'; });
        if (name_size == 0U) {
            return std::nullopt;
        }
        auto name = rest->substr(0U, name_size);

        auto tail = text::trim_left(rest->substr(name_size));
        if (!tail.starts_with(':')) {
            return std::nullopt;
        }
        auto value = text::trim_ascii(tail.substr(1U));
        if (value.empty()) {
            return std::nullopt;
        }
        return debug_info_attribute{.name = name, .value = value};
    }

    // Strips readelf form descriptors such as "(indirect string, offset: 0x2a): " or
    // "(indexed string: 0x3): " from a string attribute value. Returns nullopt when
    // the descriptor is unterminated or no string follows it.
    inline std::optional<std::string_view> debug_info_string_value(std::string_view value) {
        value = text::trim_ascii(value);
        while (value.starts_with('(')) {
            int depth = 0;
            size_t close = std::string_view::npos;
            for (size_t i = 0U; i < value.size(); ++i) {
                if (value[i] == '(') {
                    ++depth;
                }
                else if (value[i] == ')' && --depth == 0) {
                    close = i;
                    break;
                }
            }
            if (close == std::string_view::npos) {
                return std::nullopt;
            }

            auto after = text::trim_left(value.substr(close + 1U));
            if (after.starts_with(':')) {
                value = text::trim_left(after.substr(1U));
                break;
            }
            if (!after.starts_with('(')) {
                // a parenthesized name rather than a descriptor
                break;
            }
            value = after;
        }

        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }

    /*
     * Walks `readelf --debug-dump=info` output and attaches declaration coordinates
     * to existing symbols, matched by DW_AT_linkage_name.
     *
     * States:
     * - awaiting_header: nothing seen yet; attribute lines are ignored.
     * - accumulating_attributes: attributes of the current entry are collected
     *   and flushed onto the matching symbol at the next header or end of input.
     *
     * DW_AT_name under a DW_TAG_compile_unit registers a source file keyed by the
     * entry's abbreviation number. No symbol is ever created. Throws parse_error
     * for linkage or compile unit names that cannot be read.
     */
    class debug_info_collector {
      public:
        enum class state : uint8_t { awaiting_header, accumulating_attributes };

        debug_info_collector(symbol_map& symbols, source_file_map& source_files)
                : symbols{symbols}, source_files{source_files} {}

        void parse(std::string_view readelf_output) {
            for (auto line : text::split_lines(readelf_output)) {
                consume_line(line);
            }
            finish();
        }

        void consume_line(std::string_view line) {
            if (auto header = parse_debug_info_header(line)) {
                flush();
                header_abbrev_number = header->abbrev_number;
                header_tag = std::string{header->tag};
                current_state = state::accumulating_attributes;
                return;
            }

            if (current_state != state::accumulating_attributes) {
                return;
            }

            if (auto attribute = parse_debug_info_attribute(line)) {
                apply_attribute(*attribute, line);
            }
        }

        void finish() { flush(); }

        [[nodiscard]] state active_state() const noexcept { return current_state; }
        [[nodiscard]] size_t augmented_symbol_count() const noexcept { return augmented; }

      private:
        void apply_attribute(const debug_info_attribute& attribute, std::string_view line) {
            if (attribute.name == dwarf::at_linkage_name || attribute.name == dwarf::at_mips_linkage_name) {
                auto name = debug_info_string_value(attribute.value);
                if (!name) {
                    throw parse_error("Undecipherable info line '{}'"_format(line));
                }
                pending_mangled_name = std::string{*name};
            }
            else if (attribute.name == dwarf::at_decl_file) {
                pending_source_file_id = parse_integer(attribute);
            }
            else if (attribute.name == dwarf::at_decl_line) {
                pending_source_line = parse_integer(attribute);
            }
            else if (attribute.name == dwarf::at_decl_column) {
                pending_source_column = parse_integer(attribute);
            }
            else if (attribute.name == dwarf::at_name && header_tag == dwarf::tag_compile_unit) {
                auto filename = debug_info_string_value(attribute.value);
                if (!filename) {
                    throw parse_error("Unable to determine source filename from dwarf output line '{}'"_format(line));
                }
                source_files.insert_or_assign(
                        header_abbrev_number, source_file{.id = header_abbrev_number, .filename = std::string{*filename}});
            }
        }

        static std::optional<uint64_t> parse_integer(const debug_info_attribute& attribute) {
            auto value = text::parse_u64(attribute.value);
            if (!value) {
                debug_log{"ignoring non-numeric ", attribute.name, " value '", attribute.value, "'"};
            }
            return value;
        }

        void flush() {
            if (pending_mangled_name) {
                if (auto it = symbols.find(*pending_mangled_name); it != symbols.end()) {
                    it->second.source_file_id = pending_source_file_id;
                    it->second.source_line = pending_source_line;
                    it->second.source_column = pending_source_column;
                    ++augmented;
                }
            }

            pending_mangled_name.reset();
            pending_source_file_id.reset();
            pending_source_line.reset();
            pending_source_column.reset();
        }

        symbol_map& symbols;
        source_file_map& source_files;
        state current_state{state::awaiting_header};

        uint64_t header_abbrev_number{};
        std::string header_tag{};

        std::optional<std::string> pending_mangled_name{};
        std::optional<uint64_t> pending_source_file_id{};
        std::optional<uint64_t> pending_source_line{};
        std::optional<uint64_t> pending_source_column{};
        size_t augmented{};
    };

}  // namespace binmodel::internal
