#pragma once

#include <string_view>

namespace binmodel::internal::platform {

    // Executables discovered when the project was configured.
    namespace tool {
        inline constexpr auto objdump_path = std::string_view{BINMODEL_OBJDUMP_EXECUTABLE_PATH};
        inline constexpr auto nm_path = std::string_view{BINMODEL_NM_EXECUTABLE_PATH};
        inline constexpr auto readelf_path = std::string_view{BINMODEL_READELF_EXECUTABLE_PATH};
        inline constexpr auto size_path = std::string_view{BINMODEL_SIZE_EXECUTABLE_PATH};
    }  // namespace tool

}  // namespace binmodel::internal::platform
