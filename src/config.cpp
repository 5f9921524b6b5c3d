#include "binmodel/config.hpp"

#include "binmodel/format.hpp"

#include "internal/file.hpp"
#include "internal/platform.hpp"
#include "internal/text.hpp"

#include <glaze/glaze.hpp>

#include <stdexcept>
#include <string>
#include <utility>

using namespace binmodel::literals;

namespace binmodel::detail {

    struct persisted_settings {
        int schema_version{1};
        std::optional<std::string> objdump{};
        std::optional<std::string> nm{};
        std::optional<std::string> readelf{};
        std::optional<std::string> size{};
        std::optional<std::string> language{};
        std::optional<std::string> symbol_selection_regex{};
        std::optional<std::string> symbol_exclusion_regex{};
        std::optional<std::string> mangling_file{};
    };

}  // namespace binmodel::detail

namespace glz {

    template <>
    struct meta<binmodel::detail::persisted_settings> {
        using T = binmodel::detail::persisted_settings;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "objdump",
                       &T::objdump,
                       "nm",
                       &T::nm,
                       "readelf",
                       &T::readelf,
                       "size",
                       &T::size,
                       "language",
                       &T::language,
                       "symbol_selection_regex",
                       &T::symbol_selection_regex,
                       "symbol_exclusion_regex",
                       &T::symbol_exclusion_regex,
                       "mangling_file",
                       &T::mangling_file);
    };

}  // namespace glz

namespace binmodel {

    namespace fs = std::filesystem;

    namespace detail {

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static void apply_tool_path(fs::path& target, const std::optional<std::string>& value) {
            if (value && !value->empty()) {
                target = *value;
            }
        }

    }  // namespace detail

    bool try_parse_symbol_language(std::string_view text, symbol_language& out) {
        if (internal::text::ascii_iequals(text, "cpp"sv) || internal::text::ascii_iequals(text, "c++"sv)) {
            out = symbol_language::cpp;
            return true;
        }
        if (internal::text::ascii_iequals(text, "c"sv)) {
            out = symbol_language::c;
            return true;
        }
        return false;
    }

    settings default_settings() {
        settings cfg{};
        cfg.objdump_path = std::string{internal::platform::tool::objdump_path};
        cfg.nm_path = std::string{internal::platform::tool::nm_path};
        cfg.readelf_path = std::string{internal::platform::tool::readelf_path};
        cfg.size_path = std::string{internal::platform::tool::size_path};
        return cfg;
    }

    settings load_settings(const fs::path& path) {
        detail::persisted_settings persisted{};
        auto json = internal::read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(persisted, json);
        if (ec) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }
        detail::validate_supported_schema_version(persisted.schema_version, path);

        auto cfg = default_settings();
        detail::apply_tool_path(cfg.objdump_path, persisted.objdump);
        detail::apply_tool_path(cfg.nm_path, persisted.nm);
        detail::apply_tool_path(cfg.readelf_path, persisted.readelf);
        detail::apply_tool_path(cfg.size_path, persisted.size);

        if (persisted.language && !try_parse_symbol_language(*persisted.language, cfg.language)) {
            throw std::runtime_error(
                    "invalid language '{}' in {} (expected cpp|c)"_format(*persisted.language, path.string()));
        }

        cfg.symbol_selection_regex = std::move(persisted.symbol_selection_regex);
        cfg.symbol_exclusion_regex = std::move(persisted.symbol_exclusion_regex);
        if (persisted.mangling_file) {
            // relative mangling files are resolved against the settings file
            fs::path mangling_file{*persisted.mangling_file};
            cfg.mangling_file = mangling_file.is_relative() ? path.parent_path() / mangling_file : mangling_file;
        }
        return cfg;
    }

}  // namespace binmodel
