#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace binmodel {

    /*
     * Decides whether a candidate symbol, identified by its display name, enters
     * the model. Patterns are ECMAScript regular expressions anchored at the start
     * of the name:
     * - a name matching the exclusion pattern is always rejected;
     * - without a selection pattern every other name is accepted;
     * - with a selection pattern only names matching it are accepted.
     */
    class symbol_selection {
      public:
        symbol_selection() = default;

        // Throws std::runtime_error if either pattern does not compile.
        symbol_selection(
                const std::optional<std::string>& selection_pattern,
                const std::optional<std::string>& exclusion_pattern);

        [[nodiscard]] bool is_selected(std::string_view name) const;

        [[nodiscard]] bool has_selection() const noexcept { return selection.has_value(); }
        [[nodiscard]] bool has_exclusion() const noexcept { return exclusion.has_value(); }

      private:
        std::optional<std::regex> selection{};
        std::optional<std::regex> exclusion{};
    };

}  // namespace binmodel
