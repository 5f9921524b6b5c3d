#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace binmodel {

    struct transparent_string_hash {
        using is_transparent = void;

        size_t operator()(std::string_view value) const noexcept { return std::hash<std::string_view>{}(value); }
    };

    /*
     * Explicit mangled -> demangled name table, read from a side file of alternating
     * lines (mangled name, then its demangled form). Used for toolchains whose
     * binutils cannot demangle their own symbols.
     */
    class mangling {
      public:
        // Unconfigured: every lookup misses.
        mangling() = default;

        // Unconfigured when no file is given or the file does not exist.
        explicit mangling(const std::optional<std::filesystem::path>& mangling_file);

        static mangling parse(std::string_view text);

        [[nodiscard]] bool configured() const noexcept { return table.has_value(); }
        [[nodiscard]] size_t size() const noexcept { return table ? table->size() : 0U; }

        [[nodiscard]] std::optional<std::string_view> demangle(std::string_view mangled_name) const;

      private:
        using name_table = std::unordered_map<std::string, std::string, transparent_string_hash, std::equal_to<>>;

        std::optional<name_table> table{};
    };

    struct resolved_name {
        std::string name{};
        bool is_demangled{false};
    };

    /*
     * Picks the display name for a symbol:
     * 1. the mangling table entry for `mangled_name`, if any;
     * 2. otherwise `tool_candidate` (the nm -C name), trusted as demangled when the
     *    tools are known to work;
     * 3. otherwise `tool_candidate` flagged as not demangled.
     */
    resolved_name resolve_display_name(
            const mangling& table, bool tools_reliable, std::string_view mangled_name, std::string_view tool_candidate);

}  // namespace binmodel
