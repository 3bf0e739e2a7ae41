#include <tabula/runtime/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabula::runtime {

void print(const Relation& relation, std::ostream& out) {
    if (relation.empty()) {
        out << "(empty relation)\n";
        return;
    }

    // Union of field names in first-seen order.
    std::vector<std::string> names;
    std::unordered_map<std::string, std::size_t> index;
    for (const auto& row : relation) {
        for (const auto& field : row) {
            if (index.emplace(field.name, names.size()).second) {
                names.push_back(field.name);
            }
        }
    }

    // Collect all cell strings and compute column widths.
    std::size_t rows = relation.size();
    std::vector<std::vector<std::string>> cells(names.size(), std::vector<std::string>(rows));
    std::vector<std::size_t> widths(names.size());
    for (std::size_t c = 0; c < names.size(); ++c) {
        widths[c] = names[c].size();
    }
    for (std::size_t r = 0; r < rows; ++r) {
        for (const auto& field : relation[r]) {
            auto c = index.at(field.name);
            cells[c][r] = display_string(field.value);
            widths[c] = std::max(widths[c], cells[c][r].size());
        }
    }

    // Header row.
    for (std::size_t c = 0; c < names.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", names[c], widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < names.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < names.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

auto format_relation(const Relation& relation) -> std::string {
    std::ostringstream out;
    print(relation, out);
    return out.str();
}

}  // namespace tabula::runtime
