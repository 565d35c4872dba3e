#include <cstdio>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include "clink/writer.hpp"

namespace clink {

namespace writer {

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (const char ch : s) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

} // namespace writer

namespace {

std::string quoted(const std::string& s) {
    return "\"" + writer::jsonEscape(s) + "\"";
}

void writeContent(std::ostream& os, const Content& content) {
    std::visit(
        [&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, Text>) {
                os << "{\"type\":\"text\",\"text\":" << quoted(c.text) << "}";
            } else if constexpr (std::is_same_v<T, List>) {
                os << "{\"type\":\"list\",\"title\":" << quoted(c.title) << ",\"values\":[";
                for (std::size_t i = 0; i < c.values.size(); ++i) {
                    if (i) os << ",";
                    os << quoted(c.values[i]);
                }
                os << "]}";
            } else {
                os << "{\"type\":\"table\",\"rows\":[";
                for (std::size_t r = 0; r < c.rows.size(); ++r) {
                    if (r) os << ",";
                    os << "{";
                    for (std::size_t i = 0; i < c.rows[r].size(); ++i) {
                        if (i) os << ",";
                        os << quoted(c.rows[r][i].first) << ":" << quoted(c.rows[r][i].second);
                    }
                    os << "}";
                }
                os << "]}";
            }
        },
        content);
}

void writeArray(std::ostream& os, const std::vector<Content>& items) {
    os << "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) os << ",";
        writeContent(os, items[i]);
    }
    os << "]\n";
}

} // namespace

Output jsonWriter(const Status& status) {
    std::vector<Content> regular;
    std::vector<Content> alerts;
    for (const auto& element : status.elements()) {
        std::visit(
            [&](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, Alert>) {
                    alerts.insert(alerts.end(), e.content.begin(), e.content.end());
                } else {
                    regular.emplace_back(e);
                }
            },
            element);
    }

    std::ostringstream out;
    std::ostringstream err;
    writeArray(out, regular);
    if (!alerts.empty()) writeArray(err, alerts);
    return Output{out.str(), err.str()};
}

} // namespace clink
