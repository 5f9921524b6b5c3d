#include "utils.hpp"

namespace binmodel::test {
    using namespace std::string_view_literals;

    TEST_CASE("008: warning registry records and echoes", "[008][warnings]") {
        std::ostringstream sink{};
        warning_registry warnings{&sink};
        CHECK_FALSE(warnings.occurred());

        warnings.record("Unable to read assembly from binary 'a.elf'.");
        warnings.record("second");

        CHECK(warnings.occurred());
        CHECK(warnings.size() == 2U);
        CHECK(warnings.entries()[0] == "Unable to read assembly from binary 'a.elf'.");
        CHECK(warnings.contains("assembly"sv));
        CHECK_FALSE(warnings.contains("size utility"sv));
        CHECK(sink.str() == "warning: Unable to read assembly from binary 'a.elf'.\nwarning: second\n");

        warnings.clear();
        CHECK_FALSE(warnings.occurred());
    }

    TEST_CASE("008: warning registry without a sink stays silent", "[008][warnings]") {
        warning_registry warnings{nullptr};
        warnings.record("quiet");
        CHECK(warnings.occurred());
        CHECK(warnings.entries().back() == "quiet");
    }

    TEST_CASE("008: run_tool captures stdout and exit status", "[008][process]") {
        detail::temp_dir temp{"binmodel_run_tool"};
        auto tool = temp.path / "tool.sh";
        detail::make_executable_file(
                tool,
                "#!/usr/bin/env bash\n"
                "echo \"args: $*\"\n"
                "echo \"to stderr\" >&2\n"
                "exit 3\n");

        auto output = run_tool({tool.string(), "-a", "firmware.elf"});
        CHECK(output.exit_code == 3);
        CHECK_FALSE(output.succeeded());
        CHECK(output.text == "args: -a firmware.elf\n");
    }

    TEST_CASE("008: run_tool reports success and missing executables", "[008][process]") {
        detail::temp_dir temp{"binmodel_run_tool_missing"};
        auto tool = temp.path / "ok.sh";
        detail::make_executable_file(tool, "#!/usr/bin/env bash\nprintf 'line1\\nline2'\n");

        auto ok = run_tool({tool.string()});
        CHECK(ok.succeeded());
        CHECK(ok.text == "line1\nline2");

        auto missing = run_tool({(temp.path / "does-not-exist").string()});
        CHECK(missing.exit_code == 127);
        CHECK(missing.text.empty());

        CHECK_THROWS_AS(run_tool({}), std::runtime_error);
    }

    TEST_CASE("008: text files are read byte for byte", "[008][file]") {
        detail::temp_dir temp{"binmodel_read_text_file"};
        auto path = temp.path / "mangling.txt";
        detail::write_text_file(path, "_Z3foov\r\nfoo()\n\n");

        CHECK(internal::read_text_file(path) == "_Z3foov\r\nfoo()\n\n");
        CHECK_THROWS_AS(internal::read_text_file(temp.path / "absent.txt"), std::runtime_error);
    }
}  // namespace binmodel::test
