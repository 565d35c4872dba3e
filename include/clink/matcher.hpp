#ifndef CLINK_MATCHER_HPP
#define CLINK_MATCHER_HPP

#include <string>
#include <variant>
#include <vector>

#include "error.hpp"
#include "registry.hpp"

namespace clink {

struct Match {
    CommandEntry entry;
    std::vector<std::string> path;      // argv tokens the pattern consumed
    std::vector<std::string> remaining; // handed to the parser
};

// Picks the most specific registered pattern matching a prefix of `argv`:
// most literal segments before the first wildcard, then the longer pattern,
// then more literal segments overall, then the later pattern in registry order.
std::variant<Match, Error> match(const Registry& registry, const std::vector<std::string>& argv);

// Leading argv tokens up to the first flag or "--". Names the attempted command in errors and usage lookups.
std::vector<std::string> commandPath(const std::vector<std::string>& argv);

} // namespace clink

#endif // CLINK_MATCHER_HPP
