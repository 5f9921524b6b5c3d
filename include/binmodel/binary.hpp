#pragma once

#include "config.hpp"
#include "mangling.hpp"
#include "selection.hpp"
#include "symbol.hpp"
#include "warnings.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace binmodel {

    // A tool produced output too far from the expected shape to continue safely.
    class parse_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    /*
     * Per-symbol model of one compiled binary, built from binutils output.
     *
     * Construction runs every pass in a fixed order and the model is read-only
     * afterwards:
     * 1. file format    (objdump -a)
     * 2. section sizes  (size)
     * 3. symbols        (nm, mangled and demangled)
     * 4. instructions   (objdump -drwS)
     * 5. source info    (readelf --debug-dump=info)
     * 6. finalize each symbol, ordered by mangled name
     *
     * Only pass 3 creates symbols, and only those accepted by the selection
     * patterns; later passes enrich symbols that already exist.
     *
     * Throws std::runtime_error before running any tool when the file is missing,
     * and parse_error when the debug info dump cannot be read. Degraded tool output
     * is reported to the warning registry and through tools_reliable() and
     * instructions_available().
     */
    class binary {
      public:
        // Loads the mangling table named by cfg.mangling_file, if any.
        binary(std::filesystem::path filename, const settings& cfg, warning_registry& warnings);

        // Shares a mangling table loaded once for several binaries.
        binary(std::filesystem::path filename,
               const settings& cfg,
               const mangling& demangling,
               warning_registry& warnings);

        binary(const binary&) = delete;
        binary& operator=(const binary&) = delete;
        binary(binary&&) = default;
        binary& operator=(binary&&) = default;

        [[nodiscard]] const std::filesystem::path& filename() const noexcept { return path; }
        [[nodiscard]] const std::optional<std::string>& file_format() const noexcept { return format; }

        [[nodiscard]] uint64_t text_size() const noexcept { return text; }
        [[nodiscard]] uint64_t data_size() const noexcept { return data; }
        [[nodiscard]] uint64_t bss_size() const noexcept { return bss; }
        [[nodiscard]] uint64_t overall_size() const noexcept { return overall; }
        [[nodiscard]] uint64_t prog_mem_size() const noexcept { return prog_mem; }
        [[nodiscard]] uint64_t static_ram_size() const noexcept { return static_ram; }

        [[nodiscard]] bool tools_reliable() const noexcept { return binutils_work; }
        [[nodiscard]] bool instructions_available() const noexcept { return have_instructions; }

        [[nodiscard]] const symbol_map& symbols() const noexcept { return symbol_table; }
        [[nodiscard]] const source_file_map& source_files() const noexcept { return source_file_table; }
        [[nodiscard]] size_t num_symbols_dropped() const noexcept { return dropped; }

        [[nodiscard]] const symbol* find_symbol(std::string_view mangled_name) const;
        [[nodiscard]] const source_file* find_source_file(uint64_t id) const;

      private:
        void determine_file_format();
        void determine_section_sizes();
        void gather_symbol_properties(const mangling& demangling);
        void gather_symbol_instructions();
        void gather_debug_information();
        void finalize_symbols();

        std::string read_tool_output(const std::filesystem::path& tool, std::vector<std::string> args);

        std::filesystem::path path;
        settings tool_settings;
        symbol_selection selection;
        warning_registry* warnings;

        std::optional<std::string> format{};
        uint64_t text{};
        uint64_t data{};
        uint64_t bss{};
        uint64_t overall{};
        uint64_t prog_mem{};
        uint64_t static_ram{};
        bool binutils_work{true};
        bool have_instructions{false};

        symbol_map symbol_table{};
        source_file_map source_file_table{};
        size_t dropped{};
    };

}  // namespace binmodel
