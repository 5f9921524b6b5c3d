#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace binmodel {

    /*
     * Collects the non-fatal problems raised while building binary models.
     *
     * The caller creates one registry per run, hands it to every `binary` it
     * constructs and inspects it once afterwards to decide the overall exit
     * status. Each recorded warning is echoed to the sink as "warning: <msg>";
     * a null sink records silently.
     */
    class warning_registry {
      public:
        warning_registry();
        explicit warning_registry(std::ostream* sink);

        void record(std::string message);

        [[nodiscard]] bool occurred() const noexcept { return !messages.empty(); }
        [[nodiscard]] size_t size() const noexcept { return messages.size(); }
        [[nodiscard]] const std::vector<std::string>& entries() const noexcept { return messages; }

        bool contains(std::string_view needle) const;

        void clear() noexcept { messages.clear(); }

      private:
        std::ostream* sink;
        std::vector<std::string> messages{};
    };

}  // namespace binmodel
