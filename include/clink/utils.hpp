#ifndef CLINK_UTILS_HPP
#define CLINK_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clink::utils {

// Edit distance over a single rolling row.
inline std::size_t levenshteinDistance(std::string_view from, std::string_view to) {
    if (from.size() < to.size()) std::swap(from, to);
    std::vector<std::size_t> row(to.size() + 1);
    for (std::size_t j = 0; j < row.size(); ++j) row[j] = j;

    for (std::size_t i = 0; i < from.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i + 1;
        for (std::size_t j = 0; j < to.size(); ++j) {
            const std::size_t above = row[j + 1];
            const std::size_t substitute = diagonal + (from[i] == to[j] ? 0 : 1);
            row[j + 1] = std::min({above + 1, row[j] + 1, substitute});
            diagonal = above;
        }
    }
    return row[to.size()];
}

// Spelling hints for a mistyped command word or flag. Candidates that extend `typed` rank first,
// then by edit distance up to `maxDistance`, ties alphabetically. Repeated candidates count once.
inline std::vector<std::string> suggest(std::string_view typed,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxResults = 3,
                                        std::size_t maxDistance = 2) {
    std::set<std::pair<std::size_t, std::string>> ranked;
    std::set<std::string_view> seen;
    for (const auto& c : candidates) {
        if (c.empty() || !seen.insert(c).second) continue;
        const std::size_t distance = c.rfind(typed, 0) == 0 ? 0 : levenshteinDistance(typed, c);
        if (distance <= maxDistance) ranked.emplace(distance, c);
    }

    std::vector<std::string> hints;
    for (const auto& entry : ranked) {
        if (hints.size() == maxResults) break;
        hints.push_back(entry.second);
    }
    return hints;
}

// "-5" and "-0.5" are values, not flags.
inline bool isFlagToken(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    if (std::isdigit(static_cast<unsigned char>(s[1])) || s[1] == '.') return false;
    return true;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

inline std::string baseName(std::string_view path) {
    const auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) return std::string(path);
    return std::string(path.substr(pos + 1));
}

inline std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace clink::utils

#endif // CLINK_UTILS_HPP
