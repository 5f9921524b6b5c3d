#pragma once

#include <iostream>
#include <source_location>
#include <string_view>
#include <utility>

namespace binmodel {

    namespace detail {
        constexpr std::string_view source_basename(const std::source_location& loc) {
            std::string_view path{loc.file_name()};
            if (auto slash = path.rfind('/'); slash != std::string_view::npos) {
                path.remove_prefix(slash + 1U);
            }
            return path;
        }
    }  // namespace detail

// Pipeline trace on std::clog, "binmodel [file:line] ..."; compiled out with NDEBUG
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        explicit debug_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            std::clog << "binmodel [" << detail::source_basename(loc) << ':' << loc.line() << "] ";
            (std::clog << ... << std::forward<Args>(args)) << '\n';
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

}  // namespace binmodel
