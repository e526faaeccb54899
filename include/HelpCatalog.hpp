#pragma once
#include "TaskRegistry.hpp"
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace ordo {
    using HelpRow = std::pair<std::string, std::string>; // (name, doc)

    // Read-only listing of the documented tasks of a registry.
    class HelpCatalog {
    public:
        static constexpr std::size_t min_name_width = 30;

        explicit HelpCatalog(const TaskRegistry &registry) : registry(registry) {}

        // Documented tasks only, sorted by name.
        [[nodiscard]] std::vector<HelpRow> rows() const;

        /**
         * @brief Write one line per row: the name padded to the widest name
         * (at least min_name_width), one space, then the doc.
         * @param color Paint the name column cyan.
         */
        void render(std::ostream &os, bool color = false) const;

    private:
        const TaskRegistry &registry;
    };
} // namespace ordo
