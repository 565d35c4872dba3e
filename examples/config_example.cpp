#include <iostream>
#include <memory>
#include <string>

#include "clink/clink.hpp"

// ./config_example show ring_size handoff.concurrency
// ./config_example set handoff.concurrency=4
// ./config_example set ring_size=128
// ./config_example describe ring_size
int main(int argc, char** argv) {
    auto store = std::make_shared<clink::MemoryConfigStore>();
    store->define("core", "ring_size", "64", "Number of partitions in the ring");
    store->define("core", "handoff.concurrency", "2", "Concurrent handoff transfers per node");

    auto& registry = clink::registry();
    registry.setConfigStore(store);

    if (auto err = registry.registerConfigWhitelist({"handoff.concurrency"}, "core")) {
        std::cerr << err->message << "\n";
        return 1;
    }
    registry.registerConfig("handoff.concurrency", [](const std::string&, const std::string& value, const clink::ParsedArgs&) {
        return "handoff concurrency is now " + value;
    });
    registry.registerFormatter("ring_size", [](const std::string& value) { return value + " partitions"; });

    if (auto err = clink::registerConfigCommands(registry, clink::transport())) {
        std::cerr << err->message << "\n";
        return 1;
    }
    return clink::run(argc, argv);
}
