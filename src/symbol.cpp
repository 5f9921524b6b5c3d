#include "binmodel/symbol.hpp"

#include "binmodel/format.hpp"

#include "internal/text.hpp"

#include <type_traits>
#include <utility>

using namespace binmodel::literals;

namespace binmodel {

    namespace detail {

        // Position of the '(' opening the trailing top-level argument list, if the
        // name ends in one (optionally followed by qualifiers such as "const").
        static std::optional<size_t> find_argument_list(std::string_view name) {
            auto close = name.rfind(')');
            if (close == std::string_view::npos) {
                return std::nullopt;
            }

            auto trailer = name.substr(close + 1U);
            if (trailer.find("::"sv) != std::string_view::npos || trailer.find('(') != std::string_view::npos) {
                return std::nullopt;
            }

            int depth = 0;
            for (size_t i = close + 1U; i-- > 0U;) {
                if (name[i] == ')') {
                    ++depth;
                }
                else if (name[i] == '(') {
                    if (--depth == 0) {
                        // "(anonymous namespace)" and similar are not argument lists
                        if (i == 0U) {
                            return std::nullopt;
                        }
                        return i;
                    }
                }
            }
            return std::nullopt;
        }

    }  // namespace detail

    std::string tag_source_line(std::string_view source_line) {
        return "{}{}{}"_format(source_code_start_tag, source_line, source_code_end_tag);
    }

    symbol_signature cpp_symbol_variant::split(std::string_view display_name) const {
        auto open = detail::find_argument_list(display_name);
        if (!open) {
            return {.qualified_name = std::string{display_name}, .arguments = {}};
        }
        return {.qualified_name = std::string{internal::text::trim_right(display_name.substr(0U, *open))},
                .arguments = std::string{display_name.substr(*open)}};
    }

    symbol_signature c_symbol_variant::split(std::string_view display_name) const {
        return {.qualified_name = std::string{display_name}, .arguments = {}};
    }

    symbol::symbol(symbol_variant variant, std::string mangled_name, std::string display_name, bool is_demangled)
            : variant{variant}, mangled{std::move(mangled_name)}, display{std::move(display_name)}, demangled{is_demangled} {}

    symbol_language symbol::language() const noexcept {
        return std::visit([](const auto& v) { return std::remove_cvref_t<decltype(v)>::language; }, variant);
    }

    void symbol::append_instruction(std::string instruction) {
        instruction_lines.push_back(std::move(instruction));
    }

    void symbol::finalize() {
        signature = std::visit([this](const auto& v) { return v.split(display); }, variant);
    }

    symbol make_symbol(symbol_language language, std::string mangled_name, std::string display_name, bool is_demangled) {
        symbol_variant variant{};
        switch (language) {
            case symbol_language::cpp:
                variant = cpp_symbol_variant{};
                break;
            case symbol_language::c:
                variant = c_symbol_variant{};
                break;
        }
        return symbol{variant, std::move(mangled_name), std::move(display_name), is_demangled};
    }

}  // namespace binmodel
