#ifndef CLINK_DISPATCH_HPP
#define CLINK_DISPATCH_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "error.hpp"
#include "matcher.hpp"
#include "parser.hpp"
#include "registry.hpp"
#include "status.hpp"
#include "transport.hpp"

namespace clink {

// Calls the matched handler. Exceptions escaping it become handler errors, and a bare
// Status is tagged with --format when one was given.
Result execute(const Match& match, const ParsedArgs& args);

// Nodes a command should run on: the --node target, every node from the node finder for --all,
// otherwise the local node.
std::variant<std::vector<std::string>, Error> targetNodes(const Registry& registry,
                                                          const Transport& transport,
                                                          const GlobalFlags& globals);

struct NodeOutcome {
    std::string node;
    RemoteResult result;
};

// Calls `function` on each node in turn.
std::vector<NodeOutcome> fanOut(Transport& transport,
                                const std::vector<std::string>& nodes,
                                const std::string& function,
                                const std::vector<std::string>& args);

// One alert listing the nodes that failed, or nothing when all of them answered.
std::optional<Alert> failedNodes(const std::vector<NodeOutcome>& outcomes);

} // namespace clink

#endif // CLINK_DISPATCH_HPP
