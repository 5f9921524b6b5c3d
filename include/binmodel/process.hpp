#pragma once

#include <string>
#include <vector>

namespace binmodel {

    struct tool_output {
        // 127 when the executable could not be started, 128 + signal when killed
        int exit_code{-1};
        std::string text{};

        [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
    };

    // Runs args[0] with the remaining arguments, blocking until it exits. Stdout is
    // captured, stderr is discarded. Throws std::runtime_error only when the process
    // cannot be spawned or waited on; tool failures are reported through exit_code.
    tool_output run_tool(const std::vector<std::string>& args);

}  // namespace binmodel
