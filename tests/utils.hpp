#pragma once

#include "binmodel/binary.hpp"
#include "binmodel/config.hpp"
#include "binmodel/mangling.hpp"
#include "binmodel/process.hpp"
#include "binmodel/selection.hpp"
#include "binmodel/symbol.hpp"
#include "binmodel/warnings.hpp"

#include <catch2/catch_test_macros.hpp>

#include "../src/internal/debug_info.hpp"
#include "../src/internal/disassembly.hpp"
#include "../src/internal/file.hpp"
#include "../src/internal/text.hpp"
#include "../src/internal/tool_output.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace binmodel::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::vector<std::string> lines{};
        std::ifstream in{path};
        if (!in) {
            return lines;
        }
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    // Canned binutils output for one binary; empty fields make the fake tool print nothing.
    struct tool_fixture {
        std::string archive_headers{};
        std::string size_listing{};
        std::string nm_mangled{};
        std::string nm_demangled{};
        std::string disassembly{};
        std::string debug_info{};
    };

    /*
     * Fake objdump/nm/readelf/size scripts that print the fixture text chosen by
     * their arguments and append their argv to `calls.log`.
     */
    struct fake_toolchain {
        fs::path root{};
        fs::path binary_path{};
        fs::path calls_log{};
        settings cfg{};

        fake_toolchain(const fs::path& dir, const tool_fixture& fixture) : root{dir} {
            auto data = root / "data";
            write_text_file(data / "archive_headers.txt", fixture.archive_headers);
            write_text_file(data / "size.txt", fixture.size_listing);
            write_text_file(data / "nm_mangled.txt", fixture.nm_mangled);
            write_text_file(data / "nm_demangled.txt", fixture.nm_demangled);
            write_text_file(data / "disassembly.txt", fixture.disassembly);
            write_text_file(data / "debug_info.txt", fixture.debug_info);

            binary_path = root / "firmware.elf";
            write_text_file(binary_path, "\x7f" "ELF");
            calls_log = root / "calls.log";

            auto tools = root / "tools";
            make_executable_file(
                    tools / "objdump",
                    script("objdump",
                           "case \"$1\" in\n"
                           "  -a) cat \"" + (data / "archive_headers.txt").string() + "\" ;;\n"
                           "  -drwS) cat \"" + (data / "disassembly.txt").string() + "\" ;;\n"
                           "  *) exit 2 ;;\n"
                           "esac\n"));
            make_executable_file(
                    tools / "nm",
                    script("nm",
                           "for arg in \"$@\"; do\n"
                           "  if [ \"$arg\" = \"-C\" ]; then cat \"" + (data / "nm_demangled.txt").string() +
                                   "\"; exit 0; fi\n"
                           "done\n"
                           "cat \"" + (data / "nm_mangled.txt").string() + "\"\n"));
            make_executable_file(tools / "size", script("size", "cat \"" + (data / "size.txt").string() + "\"\n"));
            make_executable_file(
                    tools / "readelf", script("readelf", "cat \"" + (data / "debug_info.txt").string() + "\"\n"));

            cfg.objdump_path = tools / "objdump";
            cfg.nm_path = tools / "nm";
            cfg.size_path = tools / "size";
            cfg.readelf_path = tools / "readelf";
        }

        std::vector<std::string> calls() const { return read_lines(calls_log); }

      private:
        std::string script(std::string_view name, const std::string& body) const {
            std::ostringstream out{};
            out << "#!/usr/bin/env bash\n";
            out << "set -eu\n";
            out << "echo \"" << name << " $*\" >> \"" << calls_log.string() << "\"\n";
            out << body;
            return out.str();
        }
    };

}  // namespace binmodel::test::detail
