#include "binmodel/warnings.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace binmodel {

    warning_registry::warning_registry() : sink{&std::cerr} {}

    warning_registry::warning_registry(std::ostream* sink) : sink{sink} {}

    void warning_registry::record(std::string message) {
        if (sink != nullptr) {
            *sink << "warning: " << message << '\n';
        }
        messages.push_back(std::move(message));
    }

    bool warning_registry::contains(std::string_view needle) const {
        return std::ranges::any_of(
                messages, [needle](const std::string& message) { return message.find(needle) != std::string::npos; });
    }

}  // namespace binmodel
