#pragma once

#include "text.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace binmodel::internal {

    using namespace std::string_view_literals;

    struct size_summary {
        uint64_t text{};
        uint64_t data{};
        uint64_t bss{};
        uint64_t overall{};

        [[nodiscard]] constexpr uint64_t prog_mem() const noexcept { return text + data; }
        [[nodiscard]] constexpr uint64_t static_ram() const noexcept { return data + bss; }
    };

    struct nm_record {
        uint64_t size{};
        char kind{'?'};
        std::string_view name{};
    };

    // `objdump -a`: "<file>:     file format elf64-x86-64"
    inline std::optional<std::string> parse_file_format(std::string_view archive_headers) {
        constexpr auto marker = "file format"sv;

        auto pos = archive_headers.find(marker);
        while (pos != std::string_view::npos) {
            auto rest = archive_headers.substr(pos + marker.size());
            auto gap = text::span_of(rest, text::ascii_is_space);
            if (gap > 0U) {
                rest.remove_prefix(gap);
                auto token_size = text::span_of(rest, [](char c) { return !text::ascii_is_space(c); });
                if (token_size > 0U) {
                    return std::string{rest.substr(0U, token_size)};
                }
            }
            pos = archive_headers.find(marker, pos + 1U);
        }
        return std::nullopt;
    }

    // `size` (berkeley format): the first line that starts with four unsigned
    // integers, e.g. "    100      50      20     170      aa  firmware.elf"
    inline std::optional<size_summary> parse_size_summary(std::string_view size_output) {
        for (auto line : text::split_lines(size_output)) {
            auto rest = text::trim_left(line);
            std::array<uint64_t, 4> values{};
            bool matched = true;

            for (size_t i = 0U; i < values.size(); ++i) {
                if (i > 0U) {
                    auto gap = text::span_of(rest, text::ascii_is_space);
                    if (gap == 0U) {
                        matched = false;
                        break;
                    }
                    rest.remove_prefix(gap);
                }
                auto digits = text::span_of(rest, text::ascii_is_digit);
                auto value = digits > 0U ? text::parse_u64(rest.substr(0U, digits)) : std::nullopt;
                if (!value) {
                    matched = false;
                    break;
                }
                values[i] = *value;
                rest.remove_prefix(digits);
            }

            if (matched) {
                return size_summary{.text = values[0], .data = values[1], .bss = values[2], .overall = values[3]};
            }
        }
        return std::nullopt;
    }

    // `nm --print-size --size-sort --radix=d`: "<address> <size> <kind> <name>", single
    // separators, name is the remainder of the line and may contain spaces once demangled
    inline std::optional<nm_record> parse_nm_line(std::string_view line) {
        auto address_digits = text::span_of(line, text::ascii_is_hex_digit);
        if (address_digits == 0U || address_digits >= line.size() || !text::ascii_is_space(line[address_digits])) {
            return std::nullopt;
        }
        line.remove_prefix(address_digits + 1U);

        auto size_digits = text::span_of(line, text::ascii_is_hex_digit);
        if (size_digits == 0U || size_digits >= line.size() || !text::ascii_is_space(line[size_digits])) {
            return std::nullopt;
        }
        auto size = text::parse_u64(line.substr(0U, size_digits));
        if (!size) {
            return std::nullopt;
        }
        line.remove_prefix(size_digits + 1U);

        if (line.size() < 3U || !text::ascii_is_word(line[0]) || !text::ascii_is_space(line[1])) {
            return std::nullopt;
        }
        auto kind = line[0];
        line.remove_prefix(2U);

        return nm_record{.size = *size, .kind = kind, .name = line};
    }

}  // namespace binmodel::internal
