#include "clink/config.hpp"

#include <algorithm>
#include <exception>

#include "clink/dispatch.hpp"
#include "clink/log.hpp"
#include "clink/registry.hpp"
#include "clink/utils.hpp"

namespace clink {

void MemoryConfigStore::define(std::string app, std::string key, std::string defaultValue, std::string description) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[std::move(key)] = Entry{std::move(app), std::move(defaultValue), std::move(description)};
}

std::optional<std::string> MemoryConfigStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second.value;
}

std::optional<Error> MemoryConfigStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) return Error::config("Unknown config key: " + key, {key});
    it->second.value = value;
    return std::nullopt;
}

std::optional<std::string> MemoryConfigStore::describe(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second.description;
}

bool MemoryConfigStore::knows(const std::string& app, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    return it != entries_.end() && it->second.app == app;
}

namespace {

std::optional<std::pair<std::string, std::string>> splitAssignment(const std::string& token) {
    const auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) return std::nullopt;
    return std::make_pair(token.substr(0, eq), token.substr(eq + 1));
}

// Local node runs in-process, others go through the transport.
std::vector<NodeOutcome> callOnNodes(const Registry& registry,
                                     Transport& transport,
                                     const std::vector<std::string>& nodes,
                                     const std::string& function,
                                     const std::vector<std::string>& args) {
    const auto local = transport.localNode();
    std::vector<NodeOutcome> outcomes;
    for (const auto& node : nodes) {
        if (node != local) {
            auto remote = fanOut(transport, {node}, function, args);
            outcomes.push_back(std::move(remote.front()));
            continue;
        }
        if (function == kConfigShowFunction) {
            outcomes.push_back(NodeOutcome{node, showConfigOnNode(registry, args)});
        } else {
            outcomes.push_back(NodeOutcome{node, setConfigOnNode(registry, args)});
        }
    }
    return outcomes;
}

Result finish(Status status, const std::vector<NodeOutcome>& outcomes) {
    const auto failed = failedNodes(outcomes);
    if (!failed) return status;
    status.alert(failed->content);
    return exitStatus(1, std::move(status));
}

Result showHandler(const Registry& registry, Transport& transport, const ParsedArgs& args) {
    const auto& keys = args.overflow();
    if (keys.empty()) return Error::validation("show needs at least one config key");
    if (!registry.configStore()) return Error::config("no config store registered");

    auto nodes = targetNodes(registry, transport, args.globals());
    if (const auto* err = std::get_if<Error>(&nodes)) return *err;

    const auto outcomes =
        callOnNodes(registry, transport, std::get<std::vector<std::string>>(nodes), kConfigShowFunction, keys);

    std::vector<std::optional<Formatter>> formatters;
    formatters.reserve(keys.size());
    for (const auto& k : keys) formatters.push_back(registry.findFormatter(k));

    std::vector<Row> rows;
    for (const auto& o : outcomes) {
        const auto* values = std::get_if<std::vector<std::string>>(&o.result);
        if (values == nullptr) continue;
        Row row{{"node", o.node}};
        for (std::size_t i = 0; i < keys.size(); ++i) {
            const std::string raw = i < values->size() ? (*values)[i] : std::string();
            row.emplace_back(keys[i], formatters[i] ? (*formatters[i])(raw) : raw);
        }
        rows.push_back(std::move(row));
    }

    Status status;
    if (!rows.empty()) status.table(std::move(rows));
    return finish(std::move(status), outcomes);
}

Result setHandler(const Registry& registry, Transport& transport, const ParsedArgs& args) {
    if (!args.overflow().empty()) {
        return Error::validation("expected key=value, got: " + utils::join(args.overflow(), " "));
    }
    if (args.keys().empty()) return Error::validation("set needs at least one key=value");

    std::vector<std::string> keys;
    for (const auto& [k, v] : args.keys()) keys.push_back(k);
    std::sort(keys.begin(), keys.end());

    const auto denied = registry.notWhitelisted(keys);
    if (!denied.empty()) {
        log::logger()->warn("refusing to set {}", utils::join(denied, ", "));
        return Error::config("Setting config keys is not permitted: " + utils::join(denied, ", "), denied);
    }

    auto nodes = targetNodes(registry, transport, args.globals());
    if (const auto* err = std::get_if<Error>(&nodes)) return *err;

    std::vector<std::string> assignments;
    assignments.reserve(keys.size());
    for (const auto& k : keys) assignments.push_back(k + "=" + toString(args.keys().at(k)));

    const auto outcomes =
        callOnNodes(registry, transport, std::get<std::vector<std::string>>(nodes), kConfigSetFunction, assignments);

    Status status;
    for (const auto& o : outcomes) {
        const auto* texts = std::get_if<std::vector<std::string>>(&o.result);
        if (texts == nullptr) continue;
        for (const auto& t : *texts) status.text(t);
    }
    return finish(std::move(status), outcomes);
}

Result describeHandler(const Registry& registry, const ParsedArgs& args) {
    const auto& keys = args.overflow();
    if (keys.empty()) return Error::validation("describe needs at least one config key");
    const auto store = registry.configStore();
    if (!store) return Error::config("no config store registered");

    Status status;
    std::vector<std::string> unknown;
    for (const auto& k : keys) {
        const auto text = store->describe(k);
        if (!text) {
            unknown.push_back(k);
            continue;
        }
        status.text(k + ":\n  " + (text->empty() ? "No documentation found" : *text));
    }
    if (!unknown.empty()) return Error::config("Invalid config keys: " + utils::join(unknown, ", "), unknown);
    return status;
}

} // namespace

RemoteResult showConfigOnNode(const Registry& registry, const std::vector<std::string>& keys) {
    const auto store = registry.configStore();
    if (!store) return Error::config("no config store registered");
    std::vector<std::string> values;
    std::vector<std::string> unknown;
    for (const auto& k : keys) {
        auto v = store->get(k);
        if (!v) {
            unknown.push_back(k);
            continue;
        }
        values.push_back(std::move(*v));
    }
    if (!unknown.empty()) return Error::config("Invalid config keys: " + utils::join(unknown, ", "), unknown);
    return values;
}

RemoteResult setConfigOnNode(const Registry& registry, const std::vector<std::string>& assignments) {
    const auto store = registry.configStore();
    if (!store) return Error::config("no config store registered");

    std::vector<std::pair<std::string, std::string>> pairs;
    ParsedArgs::ValueMap keys;
    for (const auto& a : assignments) {
        auto kv = splitAssignment(a);
        if (!kv) return Error::validation("expected key=value, got: " + a);
        keys[kv->first] = kv->second;
        pairs.push_back(std::move(*kv));
    }

    std::vector<std::string> names;
    for (const auto& [k, v] : pairs) names.push_back(k);
    const auto denied = registry.notWhitelisted(names);
    if (!denied.empty()) {
        return Error::config("Setting config keys is not permitted: " + utils::join(denied, ", "), denied);
    }

    const ParsedArgs callbackArgs(std::move(keys), {}, {}, {});
    std::vector<std::string> texts;
    for (const auto& [k, v] : pairs) {
        if (auto err = store->set(k, v)) return *err;
        log::logger()->info("config {} set to {}", k, v);
        const auto callback = registry.findConfig(k);
        if (!callback) continue;
        try {
            auto text = (*callback)(k, v, callbackArgs);
            if (!text.empty()) texts.push_back(std::move(text));
        } catch (const std::exception& e) {
            return Error::handler("config callback for " + k + " failed: " + e.what());
        }
    }
    return texts;
}

void exposeConfigFunctions(const Registry& registry, LocalTransport& transport) {
    transport.expose(kConfigShowFunction,
                     [&registry](const std::vector<std::string>& args) { return showConfigOnNode(registry, args); });
    transport.expose(kConfigSetFunction,
                     [&registry](const std::vector<std::string>& args) { return setConfigOnNode(registry, args); });
}

std::optional<Error> registerConfigCommands(Registry& registry, Transport& transport) {
    const Registry& reg = registry;
    Transport* t = &transport;
    if (auto err = registry.registerCommand({"*", "show"}, KeySpec::any(), FlagSpec{},
                                            [&reg, t](const std::vector<std::string>&, const ParsedArgs& args) {
                                                return showHandler(reg, *t, args);
                                            })) {
        return err;
    }
    if (auto err = registry.registerCommand({"*", "set"}, KeySpec::any(), FlagSpec{},
                                            [&reg, t](const std::vector<std::string>&, const ParsedArgs& args) {
                                                return setHandler(reg, *t, args);
                                            })) {
        return err;
    }
    return registry.registerCommand({"*", "describe"}, KeySpec::any(), FlagSpec{},
                                    [&reg](const std::vector<std::string>&, const ParsedArgs& args) {
                                        return describeHandler(reg, args);
                                    });
}

} // namespace clink
