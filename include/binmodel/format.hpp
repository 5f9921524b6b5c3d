#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace binmodel {

    namespace detail {
        template <size_t N>
        struct format_literal {
            char text[N]{};

            consteval format_literal(const char (&s)[N]) { std::copy_n(s, N, text); }
            constexpr std::string_view view() const { return {text, N - 1U}; }
        };

        template <format_literal Pattern>
        struct bound_format {
            template <typename... Args>
            std::string operator()(Args&&... args) const {
                return std::format(Pattern.view(), std::forward<Args>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        // "{} symbols in {}"_format(count, path)
        template <detail::format_literal Pattern>
        consteval auto operator""_format() {
            return detail::bound_format<Pattern>{};
        }
    }  // namespace literals

}  // namespace binmodel
