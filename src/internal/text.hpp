#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace binmodel::internal::text {

    using namespace std::string_view_literals;

    inline constexpr char ascii_to_lower(char c) noexcept {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    inline constexpr bool ascii_iequals(std::string_view lhs, std::string_view rhs) noexcept {
        return std::ranges::equal(lhs, rhs, [](char a, char b) { return ascii_to_lower(a) == ascii_to_lower(b); });
    }

    inline constexpr bool ascii_is_space(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
    }

    inline constexpr bool ascii_is_digit(char c) noexcept {
        return c >= '0' && c <= '9';
    }

    inline constexpr bool ascii_is_hex_digit(char c) noexcept {
        auto lower = ascii_to_lower(c);
        return ascii_is_digit(c) || (lower >= 'a' && lower <= 'f');
    }

    // matches the \w class of the tools' output: alphanumerics and underscore
    inline constexpr bool ascii_is_word(char c) noexcept {
        auto lower = ascii_to_lower(c);
        return ascii_is_digit(c) || (lower >= 'a' && lower <= 'z') || c == '_';
    }

    inline constexpr std::string_view trim_left(std::string_view value) noexcept {
        while (!value.empty() && ascii_is_space(value.front())) {
            value.remove_prefix(1U);
        }
        return value;
    }

    inline constexpr std::string_view trim_right(std::string_view value) noexcept {
        while (!value.empty() && ascii_is_space(value.back())) {
            value.remove_suffix(1U);
        }
        return value;
    }

    inline constexpr std::string_view trim_ascii(std::string_view value) noexcept {
        return trim_right(trim_left(value));
    }

    inline constexpr bool is_blank(std::string_view value) noexcept {
        return std::ranges::all_of(value, [](char c) { return ascii_is_space(c); });
    }

    inline constexpr bool is_hex_token(std::string_view token) noexcept {
        return !token.empty() && std::ranges::all_of(token, [](char c) { return ascii_is_hex_digit(c); });
    }

    // Length of the run of characters at the front of `value` satisfying `pred`.
    template <typename Pred>
    inline constexpr size_t span_of(std::string_view value, Pred pred) noexcept {
        size_t n = 0U;
        while (n < value.size() && pred(value[n])) {
            ++n;
        }
        return n;
    }

    inline std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines{};
        size_t begin = 0U;
        while (begin < text.size()) {
            auto end = text.find('\n', begin);
            if (end == std::string_view::npos) {
                end = text.size();
            }

            auto line = text.substr(begin, end - begin);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1U);
            }
            lines.push_back(line);
            begin = end + 1U;
        }
        return lines;
    }

    inline std::vector<std::string_view> split_whitespace_tokens(std::string_view line) {
        std::vector<std::string_view> tokens{};
        size_t i = 0U;
        while (i < line.size()) {
            while (i < line.size() && ascii_is_space(line[i])) {
                ++i;
            }
            if (i >= line.size()) {
                break;
            }
            auto start = i;
            while (i < line.size() && !ascii_is_space(line[i])) {
                ++i;
            }
            tokens.push_back(line.substr(start, i - start));
        }
        return tokens;
    }

    inline std::optional<uint64_t> parse_u64(std::string_view token, int base = 10) {
        if (token.empty() || token.front() == '-' || token.front() == '+') {
            return std::nullopt;
        }
        uint64_t value{};
        auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value, base);
        if (ec != std::errc{} || end != token.data() + token.size()) {
            return std::nullopt;
        }
        return value;
    }

}  // namespace binmodel::internal::text
