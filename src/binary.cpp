#include "binmodel/binary.hpp"

#include "binmodel/format.hpp"
#include "binmodel/process.hpp"
#include "binmodel/log.hpp"

#include "internal/debug_info.hpp"
#include "internal/disassembly.hpp"
#include "internal/text.hpp"
#include "internal/tool_output.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace binmodel::literals;

namespace binmodel {

    namespace fs = std::filesystem;

    namespace detail {

        namespace arg_tokens {
            static constexpr auto objdump_archive_headers = "-a"sv;
            static constexpr auto objdump_disassemble_with_source = "-drwS"sv;
            static constexpr auto nm_print_size = "--print-size"sv;
            static constexpr auto nm_size_sort = "--size-sort"sv;
            static constexpr auto nm_decimal_radix = "--radix=d"sv;
            static constexpr auto nm_demangle = "-C"sv;
            static constexpr auto readelf_debug_info = "--debug-dump=info"sv;
        }  // namespace arg_tokens

        static fs::path validated_filename(fs::path filename) {
            if (filename.empty()) {
                throw std::runtime_error("No binary filename defined");
            }
            std::error_code ec{};
            if (!fs::is_regular_file(filename, ec)) {
                throw std::runtime_error("Unable to find filename {}"_format(filename.string()));
            }
            return filename;
        }

        static std::vector<std::string> nm_args(bool demangle) {
            std::vector<std::string> args{};
            args.emplace_back(arg_tokens::nm_print_size);
            args.emplace_back(arg_tokens::nm_size_sort);
            args.emplace_back(arg_tokens::nm_decimal_radix);
            if (demangle) {
                args.emplace_back(arg_tokens::nm_demangle);
            }
            return args;
        }

    }  // namespace detail

    binary::binary(fs::path filename, const settings& cfg, warning_registry& warnings)
            : binary(std::move(filename), cfg, mangling{cfg.mangling_file}, warnings) {}

    binary::binary(fs::path filename, const settings& cfg, const mangling& demangling, warning_registry& warnings)
            : path{detail::validated_filename(std::move(filename))},
              tool_settings{cfg},
              selection{cfg.symbol_selection_regex, cfg.symbol_exclusion_regex},
              warnings{&warnings} {
        determine_file_format();
        determine_section_sizes();
        gather_symbol_properties(demangling);
        gather_symbol_instructions();
        gather_debug_information();
        finalize_symbols();

        debug_log{"{}: {} symbols, {} dropped"_format(path.string(), symbol_table.size(), dropped)};
    }

    const symbol* binary::find_symbol(std::string_view mangled_name) const {
        if (auto it = symbol_table.find(mangled_name); it != symbol_table.end()) {
            return &it->second;
        }
        return nullptr;
    }

    const source_file* binary::find_source_file(uint64_t id) const {
        if (auto it = source_file_table.find(id); it != source_file_table.end()) {
            return &it->second;
        }
        return nullptr;
    }

    std::string binary::read_tool_output(const fs::path& tool, std::vector<std::string> args) {
        std::vector<std::string> command{};
        command.reserve(args.size() + 2U);
        command.push_back(tool.string());
        std::ranges::move(args, std::back_inserter(command));
        command.push_back(path.string());

        auto output = run_tool(command);
        if (output.exit_code == 127 && output.text.empty()) {
            warnings->record("Unable to run '{}' on '{}'"_format(tool.string(), path.string()));
        }
        else if (!output.succeeded()) {
            warnings->record(
                    "'{}' exited with status {} on '{}'"_format(tool.string(), output.exit_code, path.string()));
        }
        return std::move(output.text);
    }

    void binary::determine_file_format() {
        auto output = read_tool_output(
                tool_settings.objdump_path, {std::string{detail::arg_tokens::objdump_archive_headers}});

        format = internal::parse_file_format(output);
        if (format) {
            debug_log{"File format of binary {}: {}"_format(path.string(), *format)};
        }
        else {
            debug_log{"Unable to detect binary file format of {}"_format(path.string())};
        }
    }

    void binary::determine_section_sizes() {
        auto output = read_tool_output(tool_settings.size_path, {});

        auto sizes = internal::parse_size_summary(output);
        if (!sizes) {
            warnings->record("Unable to determine resource consumptions. Is the proper size utility used?");
            binutils_work = false;
            return;
        }

        text = sizes->text;
        data = sizes->data;
        bss = sizes->bss;
        overall = sizes->overall;
        prog_mem = sizes->prog_mem();
        static_ram = sizes->static_ram();
    }

    void binary::gather_symbol_properties(const mangling& demangling) {
        auto mangled_output = read_tool_output(tool_settings.nm_path, detail::nm_args(false));
        auto demangled_output = read_tool_output(tool_settings.nm_path, detail::nm_args(true));

        auto mangled_lines = internal::text::split_lines(mangled_output);
        auto demangled_lines = internal::text::split_lines(demangled_output);
        auto line_count = std::min(mangled_lines.size(), demangled_lines.size());

        dropped = 0U;
        for (size_t i = 0U; i < line_count; ++i) {
            auto record = internal::parse_nm_line(mangled_lines[i]);
            if (!record) {
                continue;
            }

            // both listings are sorted identically; fall back to the raw name if the
            // demangled line is unreadable
            auto candidate = internal::parse_nm_line(demangled_lines[i]);
            auto tool_name = candidate ? candidate->name : record->name;

            if (auto it = symbol_table.find(record->name); it != symbol_table.end()) {
                it->second.size = record->size;
                it->second.kind = record->kind;
                continue;
            }

            auto resolved = resolve_display_name(demangling, binutils_work, record->name, tool_name);
            if (!selection.is_selected(resolved.name)) {
                ++dropped;
                continue;
            }

            auto sym = make_symbol(
                    tool_settings.language, std::string{record->name}, std::move(resolved.name), resolved.is_demangled);
            sym.size = record->size;
            sym.kind = record->kind;

            std::string key{record->name};
            symbol_table.emplace(std::move(key), std::move(sym));
        }
    }

    void binary::gather_symbol_instructions() {
        auto output = read_tool_output(
                tool_settings.objdump_path, {std::string{detail::arg_tokens::objdump_disassemble_with_source}});

        internal::disassembly_collector collector{symbol_table, format};
        collector.parse(output);

        have_instructions = collector.instruction_line_count() > 0U;
        if (!have_instructions) {
            warnings->record("Unable to read assembly from binary '{}'."_format(path.string()));
        }
    }

    void binary::gather_debug_information() {
        auto output = read_tool_output(
                tool_settings.readelf_path, {std::string{detail::arg_tokens::readelf_debug_info}});

        internal::debug_info_collector collector{symbol_table, source_file_table};
        collector.parse(output);

        debug_log{"{}: source info for {} symbols, {} source files"_format(
                path.string(), collector.augmented_symbol_count(), source_file_table.size())};
    }

    void binary::finalize_symbols() {
        // std::map iterates in mangled name order
        for (auto& [mangled_name, sym] : symbol_table) {
            sym.finalize();
        }
    }

}  // namespace binmodel
