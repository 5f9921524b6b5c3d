#pragma once

#include "binmodel/format.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace binmodel::internal {

    using namespace binmodel::literals;

    // Whole file contents, bytes unchanged; throws std::runtime_error if unreadable.
    inline std::string read_text_file(const std::filesystem::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

}  // namespace binmodel::internal
