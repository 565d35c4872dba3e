#ifndef CLINK_PATTERN_HPP
#define CLINK_PATTERN_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clink {

inline constexpr std::string_view kWildcardToken = "*";

struct Wildcard {
    friend bool operator==(const Wildcard&, const Wildcard&) { return true; }
    friend bool operator!=(const Wildcard&, const Wildcard&) { return false; }
    friend bool operator<(const Wildcard&, const Wildcard&) { return false; }
};

// Wildcard is the first alternative so patterns order wildcard before literal at each position.
using Segment = std::variant<Wildcard, std::string>;

class CommandPattern {
public:
    CommandPattern() = default;
    explicit CommandPattern(std::vector<Segment> segments) : segments_(std::move(segments)) {}

    // "*" becomes a wildcard segment, anything else a literal.
    static CommandPattern fromTokens(const std::vector<std::string>& tokens);

    [[nodiscard]] const std::vector<Segment>& segments() const { return segments_; }
    [[nodiscard]] std::size_t size() const { return segments_.size(); }
    [[nodiscard]] bool empty() const { return segments_.empty(); }

    // True if the pattern matches a prefix of `argv`. Wildcards never match a flag token.
    [[nodiscard]] bool matches(const std::vector<std::string>& argv) const;

    // Number of literal segments before the first wildcard.
    [[nodiscard]] std::size_t literalPrefix() const;
    [[nodiscard]] std::size_t literalCount() const;

    [[nodiscard]] std::string toString() const;

    friend bool operator==(const CommandPattern& a, const CommandPattern& b) { return a.segments_ == b.segments_; }
    friend bool operator!=(const CommandPattern& a, const CommandPattern& b) { return !(a == b); }
    friend bool operator<(const CommandPattern& a, const CommandPattern& b) { return a.segments_ < b.segments_; }

private:
    std::vector<Segment> segments_;
};

} // namespace clink

#endif // CLINK_PATTERN_HPP
