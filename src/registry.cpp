#include "clink/registry.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <mutex>

#include "clink/config.hpp"
#include "clink/log.hpp"
#include "clink/utils.hpp"
#include "clink/writer.hpp"

namespace clink {

namespace {

std::optional<std::string> checkSegment(const std::string& token) {
    if (token.empty()) return std::string("empty command segment");
    if (token.front() == '-') return "command segment looks like a flag: " + token;
    for (const char ch : token) {
        if (std::isspace(static_cast<unsigned char>(ch))) return "command segment contains whitespace: \"" + token + "\"";
    }
    return std::nullopt;
}

} // namespace

Registry::Registry() {
    registerDefaultWriters(*this);
}

Registry& Registry::global() {
    static Registry instance;
    return instance;
}

void Registry::registerAll(const std::vector<Module>& modules) {
    for (const auto& m : modules) {
        if (m) m(*this);
    }
}

std::optional<Error> Registry::registerCommand(const std::vector<std::string>& pattern,
                                               KeySpec keys,
                                               FlagSpec flags,
                                               Handler handler) {
    if (pattern.empty()) return Error::config("cannot register an empty command pattern");
    for (const auto& token : pattern) {
        if (auto err = checkSegment(token)) return Error::config(*err);
    }
    if (!handler) return Error::config("command " + utils::join(pattern, " ") + " has no handler");
    for (const auto& f : flags.entries()) {
        if (f.longName().rfind("--", 0) != 0) return Error::config("flag long name must start with --: " + f.longName());
        if (!f.shortName().empty() && (f.shortName().size() != 2 || f.shortName()[0] != '-')) {
            return Error::config("flag short name must look like -x: " + f.shortName());
        }
    }

    auto compiled = CommandPattern::fromTokens(pattern);
    CommandEntry entry{compiled, std::move(keys), std::move(flags), std::move(handler)};
    {
        std::unique_lock lock(commandsMutex_);
        commands_[compiled] = std::move(entry);
    }
    log::logger()->debug("registered command '{}'", compiled.toString());
    return std::nullopt;
}

std::optional<Error> Registry::unregisterCommand(const std::vector<std::string>& pattern) {
    const auto compiled = CommandPattern::fromTokens(pattern);
    std::unique_lock lock(commandsMutex_);
    if (commands_.erase(compiled) == 0) return Error::config("command not registered: " + compiled.toString());
    log::logger()->debug("unregistered command '{}'", compiled.toString());
    return std::nullopt;
}

std::optional<CommandEntry> Registry::findCommand(const CommandPattern& pattern) const {
    std::shared_lock lock(commandsMutex_);
    const auto it = commands_.find(pattern);
    if (it == commands_.end()) return std::nullopt;
    return it->second;
}

std::size_t Registry::commandCount() const {
    std::shared_lock lock(commandsMutex_);
    return commands_.size();
}

void Registry::visitCommands(const std::function<void(const CommandEntry&)>& visit) const {
    std::shared_lock lock(commandsMutex_);
    for (const auto& [pattern, entry] : commands_) visit(entry);
}

void Registry::registerUsage(std::vector<std::string> path, UsageSource usage) {
    log::logger()->debug("registered usage for '{}'", utils::join(path, " "));
    std::unique_lock lock(usageMutex_);
    usage_[std::move(path)] = std::move(usage);
}

void Registry::unregisterUsage(const std::vector<std::string>& path) {
    std::unique_lock lock(usageMutex_);
    usage_.erase(path);
}

std::optional<std::string> Registry::findUsage(const std::vector<std::string>& path) const {
    std::optional<UsageSource> found;
    {
        std::shared_lock lock(usageMutex_);
        for (std::size_t len = path.size(); len > 0 && !found; --len) {
            const std::vector<std::string> prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(len));
            const auto it = usage_.find(prefix);
            if (it != usage_.end()) found = it->second;
        }
    }
    if (!found) return std::nullopt;
    if (const auto* text = std::get_if<std::string>(&*found)) return *text;
    const auto& fn = std::get<std::function<std::string()>>(*found);
    if (!fn) return std::nullopt;
    return fn();
}

void Registry::registerWriter(std::string format, Writer writer) {
    log::logger()->debug("registered writer '{}'", format);
    std::unique_lock lock(writersMutex_);
    writers_[std::move(format)] = std::move(writer);
}

void Registry::unregisterWriter(const std::string& format) {
    std::unique_lock lock(writersMutex_);
    writers_.erase(format);
}

std::optional<Writer> Registry::findWriter(const std::string& format) const {
    std::shared_lock lock(writersMutex_);
    const auto it = writers_.find(format);
    if (it == writers_.end() || !it->second) return std::nullopt;
    return it->second;
}

std::vector<std::string> Registry::writerNames() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(writersMutex_);
        for (const auto& [name, writer] : writers_) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void Registry::registerConfig(std::string key, ConfigCallback callback) {
    log::logger()->debug("registered config callback for '{}'", key);
    std::unique_lock lock(configMutex_);
    configCallbacks_[std::move(key)] = std::move(callback);
}

void Registry::unregisterConfig(const std::string& key) {
    std::unique_lock lock(configMutex_);
    configCallbacks_.erase(key);
}

std::optional<ConfigCallback> Registry::findConfig(const std::string& key) const {
    std::shared_lock lock(configMutex_);
    const auto it = configCallbacks_.find(key);
    if (it == configCallbacks_.end() || !it->second) return std::nullopt;
    return it->second;
}

void Registry::registerFormatter(std::string key, Formatter formatter) {
    log::logger()->debug("registered formatter for '{}'", key);
    std::unique_lock lock(configMutex_);
    formatters_[std::move(key)] = std::move(formatter);
}

void Registry::unregisterFormatter(const std::string& key) {
    std::unique_lock lock(configMutex_);
    formatters_.erase(key);
}

std::optional<Formatter> Registry::findFormatter(const std::string& key) const {
    std::shared_lock lock(configMutex_);
    const auto it = formatters_.find(key);
    if (it == formatters_.end() || !it->second) return std::nullopt;
    return it->second;
}

void Registry::setConfigStore(std::shared_ptr<ConfigStore> store) {
    std::unique_lock lock(configMutex_);
    configStore_ = std::move(store);
}

std::shared_ptr<ConfigStore> Registry::configStore() const {
    std::shared_lock lock(configMutex_);
    return configStore_;
}

std::optional<Error> Registry::checkWhitelistKeys(const std::vector<std::string>& keys, const std::string& app) const {
    const auto store = configStore();
    if (!store) return Error::config("no config store registered", keys);
    std::vector<std::string> invalid;
    for (const auto& k : keys) {
        if (!store->knows(app, k)) invalid.push_back(k);
    }
    if (invalid.empty()) return std::nullopt;
    return Error::config("Invalid config keys: " + utils::join(invalid, ", "), invalid);
}

std::optional<Error> Registry::registerConfigWhitelist(const std::vector<std::string>& keys, const std::string& app) {
    if (auto err = checkWhitelistKeys(keys, app)) {
        log::logger()->warn("rejected whitelist for {}: {}", app, err->message);
        return err;
    }
    std::unique_lock lock(configMutex_);
    for (const auto& k : keys) whitelist_[k].insert(app);
    log::logger()->debug("whitelisted {} config key(s) for {}", keys.size(), app);
    return std::nullopt;
}

std::optional<Error> Registry::unregisterConfigWhitelist(const std::vector<std::string>& keys, const std::string& app) {
    if (auto err = checkWhitelistKeys(keys, app)) return err;
    std::unique_lock lock(configMutex_);
    for (const auto& k : keys) {
        const auto it = whitelist_.find(k);
        if (it == whitelist_.end()) continue;
        it->second.erase(app);
        if (it->second.empty()) whitelist_.erase(it);
    }
    return std::nullopt;
}

bool Registry::isWhitelisted(const std::string& key) const {
    std::shared_lock lock(configMutex_);
    return whitelist_.find(key) != whitelist_.end();
}

std::vector<std::string> Registry::notWhitelisted(const std::vector<std::string>& keys) const {
    std::vector<std::string> out;
    std::shared_lock lock(configMutex_);
    for (const auto& k : keys) {
        if (whitelist_.find(k) == whitelist_.end()) out.push_back(k);
    }
    return out;
}

void Registry::registerNodeFinder(NodeFinder finder) {
    std::unique_lock lock(nodeFinderMutex_);
    nodeFinder_ = std::move(finder);
}

void Registry::unregisterNodeFinder() {
    std::unique_lock lock(nodeFinderMutex_);
    nodeFinder_.reset();
}

std::optional<NodeFinder> Registry::nodeFinder() const {
    std::shared_lock lock(nodeFinderMutex_);
    if (!nodeFinder_ || !*nodeFinder_) return std::nullopt;
    return nodeFinder_;
}

} // namespace clink
