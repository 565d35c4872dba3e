#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "clink/writer.hpp"

namespace clink {

namespace {

std::vector<std::string> columnsOf(const Table& table) {
    std::vector<std::string> cols;
    if (table.rows.empty()) return cols;
    for (const auto& [col, cell] : table.rows.front()) cols.push_back(col);
    return cols;
}

std::string cellAt(const Row& row, const std::string& col) {
    for (const auto& [name, cell] : row) {
        if (name == col) return cell;
    }
    return {};
}

void renderContent(std::ostream& os, const Content& content) {
    std::visit(
        [&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, Text>) {
                os << c.text;
                if (c.text.empty() || c.text.back() != '\n') os << "\n";
            } else if constexpr (std::is_same_v<T, List>) {
                if (!c.title.empty()) os << c.title << ":\n";
                for (const auto& v : c.values) os << (c.title.empty() ? "" : "  ") << v << "\n";
            } else {
                os << writer::renderTable(c);
            }
        },
        content);
}

} // namespace

namespace writer {

std::string renderTable(const Table& table) {
    const auto cols = columnsOf(table);
    if (cols.empty()) return {};

    std::vector<std::size_t> widths;
    widths.reserve(cols.size());
    for (const auto& col : cols) {
        std::size_t w = col.size();
        for (const auto& row : table.rows) w = std::max(w, cellAt(row, col).size());
        widths.push_back(w);
    }

    std::ostringstream oss;
    auto rule = [&] {
        oss << "+";
        for (const auto w : widths) oss << std::string(w + 2, '-') << "+";
        oss << "\n";
    };
    auto line = [&](auto&& cellOf) {
        oss << "|";
        for (std::size_t i = 0; i < cols.size(); ++i) {
            const std::string cell = cellOf(i);
            oss << " " << cell << std::string(widths[i] - cell.size(), ' ') << " |";
        }
        oss << "\n";
    };

    rule();
    line([&](std::size_t i) { return cols[i]; });
    rule();
    for (const auto& row : table.rows) line([&](std::size_t i) { return cellAt(row, cols[i]); });
    rule();
    return oss.str();
}

} // namespace writer

Output humanWriter(const Status& status) {
    std::ostringstream out;
    std::ostringstream err;
    for (const auto& element : status.elements()) {
        if (const auto* alert = std::get_if<Alert>(&element)) {
            for (const auto& c : alert->content) renderContent(err, c);
            continue;
        }
        std::visit(
            [&](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (!std::is_same_v<T, Alert>) renderContent(out, Content{e});
            },
            element);
    }
    return Output{out.str(), err.str()};
}

} // namespace clink
