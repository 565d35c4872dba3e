#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "clink/clink.hpp"

namespace {

void registerAdmin(clink::Registry& r) {
    r.registerUsage({"admin"},
                    "Usage: admin <command>\n\n"
                    "Commands:\n"
                    "  status             Show node status\n"
                    "  stop               Stop the node\n"
                    "  member leave NODE  Remove a member\n");
    r.registerUsage({"admin", "member"}, "Usage: admin member leave <node> [--force]\n");

    auto err = r.registerCommand({"admin", "status"}, {}, {}, [](const std::vector<std::string>&, const clink::ParsedArgs&) {
        clink::Status s;
        s.text("node is up");
        clink::Row row{{"node", "local"}, {"state", "valid"}, {"ring", "100%"}};
        s.table({row});
        return clink::Result{s};
    });
    if (err) std::cerr << err->message << "\n";

    err = r.registerCommand({"admin", "stop"}, {}, {}, [](const std::vector<std::string>&, const clink::ParsedArgs&) {
        return clink::exitStatus(17, clink::Status{}.text("refusing to stop a node with pending handoffs"), "human");
    });
    if (err) std::cerr << err->message << "\n";

    clink::FlagSpec leaveFlags{clink::Flag("--force", "-f", "Leave without handoff")};
    leaveFlags.add(clink::Flag("--wait", "-w", "Seconds to wait", clink::Kind::Integer));
    err = r.registerCommand({"admin", "member", "leave"},
                            {clink::Key("node")},
                            leaveFlags,
                            [](const std::vector<std::string>&, const clink::ParsedArgs& args) {
                                const auto node = args.getKey<std::string>("node");
                                const auto wait = args.getFlag<std::int64_t>("--wait", 30);
                                clink::Status s;
                                s.text(node + " will leave in " + std::to_string(wait) + "s");
                                if (args.getFlag<bool>("--force")) s.alert({clink::Text{"handoff skipped"}});
                                return clink::Result{s};
                            });
    if (err) std::cerr << err->message << "\n";
}

} // namespace

// ./admin_example status --format json
// ./admin_example member leave dev2 --wait 5 -f
// ./admin_example nope
int main(int argc, char** argv) {
    clink::registry().registerAll({registerAdmin});

    std::vector<std::string> args{"admin"};
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return clink::run(args);
}
