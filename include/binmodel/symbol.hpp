#pragma once

#include "config.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace binmodel {

    inline constexpr auto source_code_start_tag = "...ED_SOURCE_START..."sv;
    inline constexpr auto source_code_end_tag = "...ED_SOURCE_END..."sv;

    // Wraps an interleaved source line so renderers can tell it apart from instructions.
    std::string tag_source_line(std::string_view source_line);

    struct symbol_signature {
        std::string qualified_name{};
        std::string arguments{};
    };

    struct cpp_symbol_variant {
        static constexpr symbol_language language = symbol_language::cpp;

        // "ns::foo(int, char) const" -> {"ns::foo", "(int, char) const"}
        symbol_signature split(std::string_view display_name) const;
    };

    struct c_symbol_variant {
        static constexpr symbol_language language = symbol_language::c;

        symbol_signature split(std::string_view display_name) const;
    };

    using symbol_variant = std::variant<cpp_symbol_variant, c_symbol_variant>;

    class symbol {
      public:
        symbol(symbol_variant variant, std::string mangled_name, std::string display_name, bool is_demangled);

        [[nodiscard]] const std::string& mangled_name() const noexcept { return mangled; }
        [[nodiscard]] const std::string& display_name() const noexcept { return display; }
        [[nodiscard]] bool is_demangled() const noexcept { return demangled; }
        [[nodiscard]] symbol_language language() const noexcept;

        [[nodiscard]] const std::vector<std::string>& instructions() const noexcept { return instruction_lines; }
        void append_instruction(std::string instruction);

        // Derives the signature split; called once after all tool passes are merged.
        void finalize();

        [[nodiscard]] const std::string& qualified_name() const noexcept { return signature.qualified_name; }
        [[nodiscard]] const std::string& arguments() const noexcept { return signature.arguments; }

        uint64_t size{};
        char kind{'?'};
        std::optional<uint64_t> source_file_id{};
        std::optional<uint64_t> source_line{};
        std::optional<uint64_t> source_column{};

      private:
        symbol_variant variant;
        std::string mangled;
        std::string display;
        bool demangled;
        std::vector<std::string> instruction_lines{};
        symbol_signature signature{};
    };

    symbol make_symbol(symbol_language language, std::string mangled_name, std::string display_name, bool is_demangled);

    struct source_file {
        uint64_t id{};
        std::string filename{};
    };

    using symbol_map = std::map<std::string, symbol, std::less<>>;
    using source_file_map = std::map<uint64_t, source_file>;

}  // namespace binmodel
