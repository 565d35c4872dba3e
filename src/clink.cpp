#include "clink/clink.hpp"

#include <atomic>
#include <utility>

namespace clink {

namespace {

LocalTransport& defaultTransport() {
    static LocalTransport instance;
    return instance;
}

std::atomic<Transport*>& currentTransport() {
    static std::atomic<Transport*> current{&defaultTransport()};
    return current;
}

} // namespace

Registry& registry() {
    return Registry::global();
}

Transport& transport() {
    return *currentTransport().load();
}

void setTransport(Transport& t) {
    currentTransport().store(&t);
}

int run(const std::vector<std::string>& argv) {
    Cli cli(registry(), transport());
    return cli.run(argv);
}

int run(int argc, const char* const* argv) {
    Cli cli(registry(), transport());
    return cli.run(argc, argv);
}

int print(const Result& result, const std::vector<std::string>& path, const std::string& format) {
    Printer printer(registry(), transport());
    return printer.print(result, path, format);
}

int print(Usage, const std::vector<std::string>& path) {
    Printer printer(registry(), transport());
    return printer.printUsage(path);
}

std::optional<Error> registerCommand(const std::vector<std::string>& pattern, KeySpec keys, FlagSpec flags, Handler handler) {
    return registry().registerCommand(pattern, std::move(keys), std::move(flags), std::move(handler));
}

std::optional<Error> unregisterCommand(const std::vector<std::string>& pattern) {
    return registry().unregisterCommand(pattern);
}

void registerUsage(std::vector<std::string> path, UsageSource usage) {
    registry().registerUsage(std::move(path), std::move(usage));
}

void unregisterUsage(const std::vector<std::string>& path) {
    registry().unregisterUsage(path);
}

void registerWriter(std::string format, Writer writer) {
    registry().registerWriter(std::move(format), std::move(writer));
}

void unregisterWriter(const std::string& format) {
    registry().unregisterWriter(format);
}

void registerConfig(std::string key, ConfigCallback callback) {
    registry().registerConfig(std::move(key), std::move(callback));
}

void unregisterConfig(const std::string& key) {
    registry().unregisterConfig(key);
}

void registerFormatter(std::string key, Formatter formatter) {
    registry().registerFormatter(std::move(key), std::move(formatter));
}

void unregisterFormatter(const std::string& key) {
    registry().unregisterFormatter(key);
}

std::optional<Error> registerConfigWhitelist(const std::vector<std::string>& keys, const std::string& app) {
    return registry().registerConfigWhitelist(keys, app);
}

std::optional<Error> unregisterConfigWhitelist(const std::vector<std::string>& keys, const std::string& app) {
    return registry().unregisterConfigWhitelist(keys, app);
}

void registerNodeFinder(NodeFinder finder) {
    registry().registerNodeFinder(std::move(finder));
}

void unregisterNodeFinder() {
    registry().unregisterNodeFinder();
}

} // namespace clink
