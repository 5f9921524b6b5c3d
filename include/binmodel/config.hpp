#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace binmodel {

    using namespace std::string_view_literals;

    /*
     * Binmodel Settings
     *
     * Inspection tools
     * - objdump_path: objdump executable (archive headers, disassembly).
     * - nm_path: nm executable (symbol sizes and kinds, mangled and demangled).
     * - readelf_path: readelf executable (DWARF debug info dump).
     * - size_path: size executable (text/data/bss summary).
     *
     * Symbol model
     * - language: Symbol variant used to finalize symbols (cpp or c).
     * - symbol_selection_regex: Only symbols whose display name matches are kept.
     * - symbol_exclusion_regex: Symbols whose display name matches are dropped;
     *   takes precedence over symbol_selection_regex.
     * - mangling_file: Side file of alternating mangled/demangled lines used in
     *   preference to tool demangling.
     */

    enum class symbol_language { cpp, c };

    inline constexpr std::string_view to_string(symbol_language language) {
        switch (language) {
            case symbol_language::cpp:
                return "cpp"sv;
            case symbol_language::c:
                return "c"sv;
        }
        return "cpp"sv;
    }

    // Accepts "cpp", "c++" and "c", ignoring case.
    bool try_parse_symbol_language(std::string_view text, symbol_language& out);

    struct settings {
        std::filesystem::path objdump_path{"objdump"};
        std::filesystem::path nm_path{"nm"};
        std::filesystem::path readelf_path{"readelf"};
        std::filesystem::path size_path{"size"};

        symbol_language language{symbol_language::cpp};
        std::optional<std::string> symbol_selection_regex{};
        std::optional<std::string> symbol_exclusion_regex{};
        std::optional<std::filesystem::path> mangling_file{};
    };

    // Tool paths default to the executables found when binmodel was configured.
    settings default_settings();

    // Reads a JSON settings file; fields absent from the file keep their defaults.
    settings load_settings(const std::filesystem::path& path);

}  // namespace binmodel
