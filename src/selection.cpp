#include "binmodel/selection.hpp"

#include "binmodel/format.hpp"

#include <stdexcept>

using namespace binmodel::literals;

namespace binmodel {

    namespace detail {

        static std::optional<std::regex> compile_pattern(
                const std::optional<std::string>& pattern, std::string_view role) {
            if (!pattern) {
                return std::nullopt;
            }
            try {
                return std::regex{*pattern, std::regex::ECMAScript};
            } catch (const std::regex_error& e) {
                throw std::runtime_error("invalid symbol {} regex '{}': {}"_format(role, *pattern, e.what()));
            }
        }

        static bool matches_prefix(const std::regex& pattern, std::string_view name) {
            return std::regex_search(name.begin(), name.end(), pattern, std::regex_constants::match_continuous);
        }

    }  // namespace detail

    symbol_selection::symbol_selection(
            const std::optional<std::string>& selection_pattern, const std::optional<std::string>& exclusion_pattern)
            : selection{detail::compile_pattern(selection_pattern, "selection")},
              exclusion{detail::compile_pattern(exclusion_pattern, "exclusion")} {}

    bool symbol_selection::is_selected(std::string_view name) const {
        if (exclusion && detail::matches_prefix(*exclusion, name)) {
            return false;
        }
        if (!selection) {
            return true;
        }
        return detail::matches_prefix(*selection, name);
    }

}  // namespace binmodel
