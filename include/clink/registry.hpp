#ifndef CLINK_REGISTRY_HPP
#define CLINK_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "error.hpp"
#include "flag.hpp"
#include "parser.hpp"
#include "pattern.hpp"
#include "status.hpp"

namespace clink {

class ConfigStore;
class Registry;

// Called with the argv tokens the pattern consumed (wildcards carry the typed token).
using Handler = std::function<Result(const std::vector<std::string>& path, const ParsedArgs& args)>;

struct CommandEntry {
    CommandPattern pattern;
    KeySpec keys;
    FlagSpec flags;
    Handler handler;
};

struct Output {
    std::string out;
    std::string err;
};

using Writer = std::function<Output(const Status&)>;
using UsageSource = std::variant<std::string, std::function<std::string()>>;
// Runs after `key` was set to `value`; the returned text is printed.
using ConfigCallback = std::function<std::string(const std::string& key, const std::string& value, const ParsedArgs& args)>;
using Formatter = std::function<std::string(const std::string& value)>;
using NodeFinder = std::function<std::vector<std::string>()>;
// A plugin's registration entry point.
using Module = std::function<void(Registry&)>;

// Process-wide tables behind the registration API. Each table has its own lock; lookups hand back
// copies so no lock is held while user callbacks run.
class Registry {
public:
    Registry();
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    static Registry& global();

    void registerAll(const std::vector<Module>& modules);

    // Re-registering a pattern replaces the previous entry.
    std::optional<Error> registerCommand(const std::vector<std::string>& pattern,
                                         KeySpec keys,
                                         FlagSpec flags,
                                         Handler handler);
    std::optional<Error> unregisterCommand(const std::vector<std::string>& pattern);
    [[nodiscard]] std::optional<CommandEntry> findCommand(const CommandPattern& pattern) const;
    [[nodiscard]] std::size_t commandCount() const;

    // Runs `visit` under the command table's shared lock. `visit` must not call back into the registry.
    void visitCommands(const std::function<void(const CommandEntry&)>& visit) const;

    void registerUsage(std::vector<std::string> path, UsageSource usage);
    void unregisterUsage(const std::vector<std::string>& path);
    // Text of the longest registered prefix of `path`.
    [[nodiscard]] std::optional<std::string> findUsage(const std::vector<std::string>& path) const;

    void registerWriter(std::string format, Writer writer);
    void unregisterWriter(const std::string& format);
    [[nodiscard]] std::optional<Writer> findWriter(const std::string& format) const;
    [[nodiscard]] std::vector<std::string> writerNames() const;

    void registerConfig(std::string key, ConfigCallback callback);
    void unregisterConfig(const std::string& key);
    [[nodiscard]] std::optional<ConfigCallback> findConfig(const std::string& key) const;

    void registerFormatter(std::string key, Formatter formatter);
    void unregisterFormatter(const std::string& key);
    [[nodiscard]] std::optional<Formatter> findFormatter(const std::string& key) const;

    void setConfigStore(std::shared_ptr<ConfigStore> store);
    [[nodiscard]] std::shared_ptr<ConfigStore> configStore() const;

    // All keys must be known to the config store for `app`, otherwise nothing changes.
    std::optional<Error> registerConfigWhitelist(const std::vector<std::string>& keys, const std::string& app);
    std::optional<Error> unregisterConfigWhitelist(const std::vector<std::string>& keys, const std::string& app);
    [[nodiscard]] bool isWhitelisted(const std::string& key) const;
    // Keys of `keys` that may not be set.
    [[nodiscard]] std::vector<std::string> notWhitelisted(const std::vector<std::string>& keys) const;

    void registerNodeFinder(NodeFinder finder);
    void unregisterNodeFinder();
    [[nodiscard]] std::optional<NodeFinder> nodeFinder() const;

private:
    std::optional<Error> checkWhitelistKeys(const std::vector<std::string>& keys, const std::string& app) const;

    mutable std::shared_mutex commandsMutex_;
    std::map<CommandPattern, CommandEntry> commands_;

    mutable std::shared_mutex usageMutex_;
    std::map<std::vector<std::string>, UsageSource> usage_;

    mutable std::shared_mutex writersMutex_;
    std::unordered_map<std::string, Writer> writers_;

    mutable std::shared_mutex configMutex_;
    std::unordered_map<std::string, ConfigCallback> configCallbacks_;
    std::unordered_map<std::string, Formatter> formatters_;
    std::shared_ptr<ConfigStore> configStore_;
    // key -> applications that whitelisted it
    std::map<std::string, std::set<std::string>> whitelist_;

    mutable std::shared_mutex nodeFinderMutex_;
    std::optional<NodeFinder> nodeFinder_;
};

} // namespace clink

#endif // CLINK_REGISTRY_HPP
