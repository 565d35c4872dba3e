#include "clink/dispatch.hpp"

#include <exception>

#include "clink/log.hpp"
#include "clink/utils.hpp"

namespace clink {

Result execute(const Match& match, const ParsedArgs& args) {
    const auto name = match.entry.pattern.toString();
    log::logger()->debug("dispatching '{}' to '{}'", utils::join(match.path, " "), name);

    Result result;
    try {
        result = match.entry.handler(match.path, args);
    } catch (const std::exception& e) {
        log::logger()->warn("handler for '{}' failed: {}", name, e.what());
        return Error::handler(e.what());
    } catch (...) {
        log::logger()->warn("handler for '{}' threw a non-standard exception", name);
        return Error::handler("handler failed");
    }

    const auto& format = args.globals().format;
    if (const auto* status = std::get_if<Status>(&result); status != nullptr && format) {
        return TaggedStatus{*status, 0, *format};
    }
    return result;
}

std::variant<std::vector<std::string>, Error> targetNodes(const Registry& registry,
                                                          const Transport& transport,
                                                          const GlobalFlags& globals) {
    if (globals.all && globals.node) return Error::validation("--all and --node cannot be combined");
    if (globals.node) return std::vector<std::string>{*globals.node};
    if (!globals.all) return std::vector<std::string>{transport.localNode()};

    const auto finder = registry.nodeFinder();
    if (!finder) {
        log::logger()->warn("--all given but no node finder is registered, using {}", transport.localNode());
        return std::vector<std::string>{transport.localNode()};
    }
    auto nodes = (*finder)();
    if (nodes.empty()) return Error::handler("The node finder returned no nodes");
    return nodes;
}

std::vector<NodeOutcome> fanOut(Transport& transport,
                                const std::vector<std::string>& nodes,
                                const std::string& function,
                                const std::vector<std::string>& args) {
    std::vector<NodeOutcome> outcomes;
    outcomes.reserve(nodes.size());
    for (const auto& node : nodes) {
        auto result = transport.call(node, function, args);
        if (const auto* err = std::get_if<Error>(&result)) {
            log::logger()->warn("{} failed on {}: {}", function, node, err->message);
        }
        outcomes.push_back(NodeOutcome{node, std::move(result)});
    }
    return outcomes;
}

std::optional<Alert> failedNodes(const std::vector<NodeOutcome>& outcomes) {
    std::vector<std::string> lines;
    for (const auto& o : outcomes) {
        if (const auto* err = std::get_if<Error>(&o.result)) lines.push_back(o.node + ": " + err->message);
    }
    if (lines.empty()) return std::nullopt;
    return Alert{{List{"Failed on the following nodes", std::move(lines)}}};
}

} // namespace clink
