#ifndef CLINK_CONFIG_HPP
#define CLINK_CONFIG_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "transport.hpp"

namespace clink {

class Registry;

// Application configuration seen by the config commands. Keys belong to the application that defined them.
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual std::optional<Error> set(const std::string& key, const std::string& value) = 0;
    [[nodiscard]] virtual std::optional<std::string> describe(const std::string& key) const = 0;
    [[nodiscard]] virtual bool knows(const std::string& app, const std::string& key) const = 0;
};

class MemoryConfigStore : public ConfigStore {
public:
    void define(std::string app, std::string key, std::string defaultValue, std::string description = {});

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    std::optional<Error> set(const std::string& key, const std::string& value) override;
    [[nodiscard]] std::optional<std::string> describe(const std::string& key) const override;
    [[nodiscard]] bool knows(const std::string& app, const std::string& key) const override;

private:
    struct Entry {
        std::string app;
        std::string value;
        std::string description;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

// Remote function names used by `show` and `set` for nodes other than the local one.
inline constexpr const char* kConfigShowFunction = "clink.config.show";
inline constexpr const char* kConfigSetFunction = "clink.config.set";

// Registers `<script> show`, `<script> set` and `<script> describe`. The first segment is a wildcard
// so any script name works; an application may shadow them with literal patterns.
std::optional<Error> registerConfigCommands(Registry& registry, Transport& transport);

// The node side of show/set, as run for a caller: values of `keys`, or the texts of the set callbacks
// after storing `key=value` assignments.
RemoteResult showConfigOnNode(const Registry& registry, const std::vector<std::string>& keys);
RemoteResult setConfigOnNode(const Registry& registry, const std::vector<std::string>& assignments);

// Serves show/set for remote callers through `transport`.
void exposeConfigFunctions(const Registry& registry, LocalTransport& transport);

} // namespace clink

#endif // CLINK_CONFIG_HPP
