#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include "clink/writer.hpp"

namespace clink {

namespace writer {

std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
    std::string out = "\"";
    for (const char ch : s) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

} // namespace writer

namespace {

void writeRecord(std::ostream& os, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i) os << ",";
        os << writer::csvField(fields[i]);
    }
    os << "\r\n";
}

void writeContent(std::ostream& os, const Content& content) {
    std::visit(
        [&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, Text>) {
                os << c.text;
                if (c.text.empty() || c.text.back() != '\n') os << "\n";
            } else if constexpr (std::is_same_v<T, List>) {
                writeRecord(os, c.values);
            } else {
                if (c.rows.empty()) return;
                std::vector<std::string> header;
                for (const auto& [col, cell] : c.rows.front()) header.push_back(col);
                writeRecord(os, header);
                for (const auto& row : c.rows) {
                    std::vector<std::string> fields;
                    fields.reserve(header.size());
                    for (const auto& col : header) {
                        std::string cell;
                        for (const auto& [name, value] : row) {
                            if (name == col) {
                                cell = value;
                                break;
                            }
                        }
                        fields.push_back(std::move(cell));
                    }
                    writeRecord(os, fields);
                }
            }
        },
        content);
}

} // namespace

Output csvWriter(const Status& status) {
    std::ostringstream out;
    std::ostringstream err;
    for (const auto& element : status.elements()) {
        std::visit(
            [&](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, Alert>) {
                    for (const auto& c : e.content) writeContent(err, c);
                } else {
                    writeContent(out, Content{e});
                }
            },
            element);
    }
    return Output{out.str(), err.str()};
}

} // namespace clink
