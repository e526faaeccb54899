#include "../include/HelpCatalog.hpp"
#include <algorithm>
#include <ostream>
#include <ranges>

using namespace ordo;

std::vector<HelpRow> HelpCatalog::rows() const {
    std::vector<HelpRow> out;
    for (const auto &task: registry.all()) {
        if (task.doc) out.emplace_back(task.name, *task.doc);
    }
    std::ranges::sort(out, {}, &HelpRow::first);
    return out;
}

void HelpCatalog::render(std::ostream &os, const bool color) const {
    const auto listing = rows();
    std::size_t width = min_name_width;
    for (const auto &name: listing | std::views::keys) width = std::max(width, name.size());

    for (const auto &[name, doc]: listing) {
        const std::string padded = name + std::string(width - name.size(), ' ');
        if (color) {
            os << "\033[36m" << padded << "\033[0m " << doc << '\n';
        } else {
            os << padded << ' ' << doc << '\n';
        }
    }
    os.flush();
}
