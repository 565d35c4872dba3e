#include "clink/matcher.hpp"

#include <cstddef>
#include <optional>
#include <tuple>

#include "clink/log.hpp"
#include "clink/utils.hpp"

namespace clink {

namespace {

using Score = std::tuple<std::size_t, std::size_t, std::size_t>;

Score scoreOf(const CommandPattern& p) {
    return Score{p.literalPrefix(), p.size(), p.literalCount()};
}

// How many leading segments of `p` agree with `argv`.
std::size_t agreement(const CommandPattern& p, const std::vector<std::string>& argv) {
    std::size_t n = 0;
    for (; n < p.size() && n < argv.size(); ++n) {
        const auto* literal = std::get_if<std::string>(&p.segments()[n]);
        if (literal != nullptr && *literal != argv[n]) break;
        if (literal == nullptr && utils::isFlagToken(argv[n])) break;
    }
    return n;
}

// "Did you mean" candidates: literals that would continue the deepest partial match.
std::vector<std::string> suggestCommands(const Registry& registry, const std::vector<std::string>& argv) {
    std::size_t deepest = 0;
    std::vector<std::string> candidates;
    registry.visitCommands([&](const CommandEntry& e) {
        const auto n = agreement(e.pattern, argv);
        if (n >= e.pattern.size() || n >= argv.size()) return;
        const auto* next = std::get_if<std::string>(&e.pattern.segments()[n]);
        if (next == nullptr) return;
        if (n > deepest) {
            deepest = n;
            candidates.clear();
        }
        if (n == deepest) candidates.push_back(*next);
    });
    if (deepest >= argv.size()) return {};
    return utils::suggest(argv[deepest], candidates);
}

} // namespace

std::vector<std::string> commandPath(const std::vector<std::string>& argv) {
    std::vector<std::string> out;
    for (const auto& t : argv) {
        if (t == "--" || utils::isFlagToken(t)) break;
        out.push_back(t);
    }
    return out;
}

std::variant<Match, Error> match(const Registry& registry, const std::vector<std::string>& argv) {
    std::optional<CommandEntry> best;
    Score bestScore{};
    registry.visitCommands([&](const CommandEntry& e) {
        if (!e.pattern.matches(argv)) return;
        const auto score = scoreOf(e.pattern);
        // Patterns arrive in ascending order, so ">=" lets the later one win a full tie.
        if (!best || score >= bestScore) {
            best = e;
            bestScore = score;
        }
    });

    if (!best) {
        const auto attempted = utils::join(commandPath(argv), " ");
        log::logger()->debug("no command matches '{}'", attempted);
        return Error::unknownCommand("Unknown command: " + attempted, suggestCommands(registry, argv));
    }

    Match m;
    const auto consumed = static_cast<std::ptrdiff_t>(best->pattern.size());
    m.path.assign(argv.begin(), argv.begin() + consumed);
    m.remaining.assign(argv.begin() + consumed, argv.end());
    log::logger()->debug("'{}' matched pattern '{}'", utils::join(argv, " "), best->pattern.toString());
    m.entry = std::move(*best);
    return m;
}

} // namespace clink
