#include "binmodel/mangling.hpp"

#include "binmodel/log.hpp"

#include "internal/file.hpp"
#include "internal/text.hpp"

#include <system_error>

namespace binmodel {

    namespace fs = std::filesystem;

    mangling::mangling(const std::optional<fs::path>& mangling_file) {
        if (!mangling_file) {
            return;
        }

        std::error_code ec{};
        if (!fs::is_regular_file(*mangling_file, ec)) {
            debug_log{"mangling file '", mangling_file->string(), "' not found, relying on tool demangling"};
            return;
        }

        *this = parse(internal::read_text_file(*mangling_file));
        debug_log{"Mangling info of ", size(), " symbols read from file '", mangling_file->string(), "'"};
    }

    mangling mangling::parse(std::string_view text) {
        mangling result{};
        result.table.emplace();

        auto lines = internal::text::split_lines(text);
        for (size_t i = 0U; i + 1U < lines.size(); i += 2U) {
            result.table->insert_or_assign(std::string{lines[i]}, std::string{lines[i + 1U]});
        }
        return result;
    }

    std::optional<std::string_view> mangling::demangle(std::string_view mangled_name) const {
        if (!table) {
            return std::nullopt;
        }
        if (auto it = table->find(mangled_name); it != table->end()) {
            return std::string_view{it->second};
        }
        return std::nullopt;
    }

    resolved_name resolve_display_name(
            const mangling& table, bool tools_reliable, std::string_view mangled_name, std::string_view tool_candidate) {
        if (auto demangled = table.demangle(mangled_name)) {
            return {.name = std::string{*demangled}, .is_demangled = true};
        }

        // working binutils already demangled the candidate (nm -C)
        return {.name = std::string{tool_candidate}, .is_demangled = tools_reliable};
    }

}  // namespace binmodel
