#include "clink/pattern.hpp"

#include "clink/utils.hpp"

namespace clink {

CommandPattern CommandPattern::fromTokens(const std::vector<std::string>& tokens) {
    std::vector<Segment> segments;
    segments.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (t == kWildcardToken) {
            segments.emplace_back(Wildcard{});
        } else {
            segments.emplace_back(t);
        }
    }
    return CommandPattern(std::move(segments));
}

bool CommandPattern::matches(const std::vector<std::string>& argv) const {
    if (segments_.size() > argv.size()) return false;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (const auto* literal = std::get_if<std::string>(&segments_[i])) {
            if (*literal != argv[i]) return false;
        } else if (utils::isFlagToken(argv[i]) || argv[i] == "--") {
            return false;
        }
    }
    return true;
}

std::size_t CommandPattern::literalPrefix() const {
    std::size_t n = 0;
    for (const auto& s : segments_) {
        if (!std::holds_alternative<std::string>(s)) break;
        ++n;
    }
    return n;
}

std::size_t CommandPattern::literalCount() const {
    std::size_t n = 0;
    for (const auto& s : segments_) {
        if (std::holds_alternative<std::string>(s)) ++n;
    }
    return n;
}

std::string CommandPattern::toString() const {
    std::string out;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i) out += " ";
        if (const auto* literal = std::get_if<std::string>(&segments_[i])) {
            out += *literal;
        } else {
            out += kWildcardToken;
        }
    }
    return out;
}

} // namespace clink
