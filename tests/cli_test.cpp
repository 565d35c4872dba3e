#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "clink/cli.hpp"
#include "clink/clink.hpp"

using namespace clink;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("CLINK_FORMAT");
        ASSERT_FALSE(registry.registerCommand({"admin", "status"}, {}, {}, [this](const std::vector<std::string>&, const ParsedArgs&) {
            ++statusCalls;
            Status s;
            s.text("ring ready");
            return Result{s};
        }));
        ASSERT_FALSE(registry.registerCommand({"admin", "stop"}, {}, {}, [](const std::vector<std::string>&, const ParsedArgs&) {
            return exitStatus(17, Status{}.text("stop refused"), "human");
        }));
        registry.registerUsage({"admin"}, std::string("Usage: admin <status|stop>\n"));
    }

    int run(const std::vector<std::string>& argv) {
        Cli cli(registry, transport, out);
        return cli.run(argv);
    }

    Registry registry;
    std::ostringstream out;
    std::ostringstream err;
    LocalTransport transport{"local", err};
    int statusCalls{0};
};

TEST_F(CliTest, BareStatusExitsZeroWithHumanOutput) {
    EXPECT_EQ(run({"admin", "status"}), 0);
    EXPECT_EQ(out.str(), "ring ready\n");
    EXPECT_EQ(statusCalls, 1);
}

TEST_F(CliTest, TaggedExitCodeIsReturned) {
    EXPECT_EQ(run({"admin", "stop"}), 17);
    EXPECT_EQ(out.str(), "stop refused\n");
}

TEST_F(CliTest, UnknownCommandRunsNothing) {
    EXPECT_EQ(run({"admin", "nope"}), 1);
    EXPECT_EQ(statusCalls, 0);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Error: Unknown command: admin nope\nUsage: admin <status|stop>\n");
}

TEST_F(CliTest, UnknownCommandSuggestsSpelling) {
    EXPECT_EQ(run({"admin", "stats"}), 1);
    EXPECT_NE(err.str().find("Did you mean this?\n  status\n"), std::string::npos);
}

TEST_F(CliTest, FormatFlagSelectsWriter) {
    EXPECT_EQ(run({"admin", "status", "--format", "json"}), 0);
    EXPECT_EQ(out.str(), "[{\"type\":\"text\",\"text\":\"ring ready\"}]\n");
}

TEST_F(CliTest, ErrorsIgnoreFormatFlag) {
    EXPECT_EQ(run({"admin", "status", "--bogus", "--format", "json"}), 1);
    EXPECT_EQ(statusCalls, 0);
    EXPECT_EQ(err.str().rfind("Error: unknown flag: --bogus", 0), 0u);
}

TEST_F(CliTest, UnregisteredFormatFailsInvocation) {
    EXPECT_EQ(run({"admin", "status", "--format", "yaml"}), 1);
    EXPECT_EQ(statusCalls, 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Invalid output format: yaml\n");
}

TEST_F(CliTest, GlobalFlagsAreAcceptedByEveryCommand) {
    EXPECT_EQ(run({"admin", "status", "--all", "-n", "local", "--format=human"}), 0);
    EXPECT_EQ(statusCalls, 1);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CliTest, HelpPrintsLongestPrefixUsage) {
    registry.registerUsage({"admin", "status"}, std::string("Usage: admin status\n"));
    EXPECT_EQ(run({"admin", "status", "--help"}), 0);
    EXPECT_EQ(out.str(), "Usage: admin status\n");
    EXPECT_EQ(statusCalls, 0);
}

TEST_F(CliTest, HelpOnUnknownCommandPrintsUsage) {
    EXPECT_EQ(run({"admin", "nope", "-h"}), 0);
    EXPECT_EQ(out.str(), "Usage: admin <status|stop>\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CliTest, HelpWithoutUsageFallsBack) {
    EXPECT_EQ(run({"tool", "-h"}), 0);
    EXPECT_EQ(out.str(), "Error: Usage information not found for the given command.\n");
}

TEST_F(CliTest, HelpAfterSeparatorIsAnArgument) {
    ASSERT_FALSE(registry.registerCommand({"admin", "echo"}, KeySpec::any(), {},
                                          [](const std::vector<std::string>&, const ParsedArgs& args) {
                                              return Result{Status{}.list("", args.overflow())};
                                          }));
    EXPECT_EQ(run({"admin", "echo", "--", "-h"}), 0);
    EXPECT_EQ(out.str(), "-h\n");
}

TEST_F(CliTest, CommandMayDeclareItsOwnHelpFlag) {
    ASSERT_FALSE(registry.registerCommand({"admin", "doc"}, {}, FlagSpec{Flag("--help", "-h", "Topic", Kind::String)},
                                          [](const std::vector<std::string>&, const ParsedArgs& args) {
                                              return Result{Status{}.text("topic " + args.getFlag<std::string>("--help"))};
                                          }));
    EXPECT_EQ(run({"admin", "doc", "--help", "ring"}), 0);
    EXPECT_EQ(out.str(), "topic ring\n");
}

TEST_F(CliTest, HelpTokenAsFlagValueIsNotAHelpRequest) {
    ASSERT_FALSE(registry.registerCommand({"admin", "member", "leave", "*"}, {}, {},
                                          [](const std::vector<std::string>&, const ParsedArgs& args) {
                                              return Result{Status{}.text("leaving via " + args.globals().node.value_or("?"))};
                                          }));
    registry.registerUsage({"admin", "member"}, std::string("Usage: admin member leave <node>\n"));
    EXPECT_EQ(run({"admin", "member", "leave", "x", "--node", "-h"}), 0);
    EXPECT_EQ(out.str(), "leaving via -h\n");

    out.str("");
    EXPECT_EQ(run({"admin", "member", "leave", "x", "--node=dev1", "-h"}), 0);
    EXPECT_EQ(out.str(), "Usage: admin member leave <node>\n");
}

TEST_F(CliTest, ValidationFailureRunsNothing) {
    std::int64_t seen = -1;
    ASSERT_FALSE(registry.registerCommand({"admin", "resize"}, KeySpec{Key("size", Kind::Integer)}, {},
                                          [&seen](const std::vector<std::string>&, const ParsedArgs& args) {
                                              seen = args.getKey<std::int64_t>("size");
                                              return Result{Status{}};
                                          }));
    EXPECT_EQ(run({"admin", "resize", "big"}), 1);
    EXPECT_EQ(seen, -1);
    EXPECT_EQ(err.str(), "Error: invalid value \"big\" for key size: expected integer\n");

    EXPECT_EQ(run({"admin", "resize", "256"}), 0);
    EXPECT_EQ(seen, 256);
}

TEST_F(CliTest, HandlerReceivesFullCommandPath) {
    std::vector<std::string> seen;
    const std::vector<std::string> cmd{"clink-test", "basic_cmd_test"};
    ASSERT_FALSE(registry.registerCommand(cmd, {}, {}, [&seen](const std::vector<std::string>& path, const ParsedArgs&) {
        seen = path;
        return Result{Status{}};
    }));
    EXPECT_EQ(run(cmd), 0);
    EXPECT_EQ(seen, cmd);
}

TEST_F(CliTest, ExitStatusWithEmptyPayload) {
    ASSERT_FALSE(registry.registerCommand({"clink-test", "cmd_error_status_test"}, {}, {},
                                          [](const std::vector<std::string>&, const ParsedArgs&) {
                                              return exitStatus(123, Status{});
                                          }));
    EXPECT_EQ(run({"clink-test", "cmd_error_status_test"}), 123);
}

TEST_F(CliTest, HandlerErrorIsExitOne) {
    ASSERT_FALSE(registry.registerCommand({"admin", "fail"}, {}, {}, [](const std::vector<std::string>&, const ParsedArgs&) {
        return Result{Error::handler("partition 7 unavailable")};
    }));
    EXPECT_EQ(run({"admin", "fail", "--format", "json"}), 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Error: partition 7 unavailable\n");
}

TEST_F(CliTest, FormatFlagAppliesToTaggedStatusWithoutFormat) {
    ASSERT_FALSE(registry.registerCommand({"admin", "drain"}, {}, {}, [](const std::vector<std::string>&, const ParsedArgs&) {
        return exitStatus(3, Status{}.text("draining"));
    }));
    EXPECT_EQ(run({"admin", "drain", "--format", "json"}), 3);
    EXPECT_EQ(out.str(), "[{\"type\":\"text\",\"text\":\"draining\"}]\n");
}

TEST_F(CliTest, NonStandardThrowIsHandlerError) {
    ASSERT_FALSE(registry.registerCommand({"admin", "boom"}, {}, {}, [](const std::vector<std::string>&, const ParsedArgs&) -> Result {
        throw 42;
    }));
    int code = 0;
    EXPECT_NO_THROW(code = run({"admin", "boom"}));
    EXPECT_EQ(code, 1);
    EXPECT_EQ(err.str(), "Error: handler failed\n");
}

TEST_F(CliTest, EnvironmentSetsDefaultFormat) {
    setenv("CLINK_FORMAT", "json", 1);
    EXPECT_EQ(run({"admin", "status"}), 0);
    unsetenv("CLINK_FORMAT");
    EXPECT_EQ(out.str(), "[{\"type\":\"text\",\"text\":\"ring ready\"}]\n");
}

TEST_F(CliTest, OptionsSetDefaultFormat) {
    Cli::Options options;
    options.defaultFormat = "csv";
    Cli cli(registry, transport, options, out);
    EXPECT_EQ(cli.run({"admin", "status"}), 0);
    EXPECT_EQ(out.str(), "ring ready\n");
    EXPECT_EQ(cli.run({"admin", "status", "--format", "yaml"}), 1);
}

TEST_F(CliTest, ArgvUsesScriptBaseName) {
    const char* argv[] = {"/usr/sbin/admin", "status"};
    Cli cli(registry, transport, out);
    EXPECT_EQ(cli.run(2, argv), 0);
    EXPECT_EQ(statusCalls, 1);
}

TEST(GlobalApiTest, ForwardsToProcessRegistry) {
    std::ostringstream err;
    LocalTransport local("local", err);
    Transport& previous = transport();
    setTransport(local);

    EXPECT_FALSE(registerCommand({"global-test", "ping"}, {}, {}, [](const std::vector<std::string>&, const ParsedArgs&) {
        return exitStatus(5, Status{});
    }));
    EXPECT_EQ(&registry(), &Registry::global());
    EXPECT_EQ(&transport(), &local);
    EXPECT_EQ(run(std::vector<std::string>{"global-test", "ping"}), 5);
    EXPECT_EQ(run(std::vector<std::string>{"global-test", "nope"}), 1);
    EXPECT_NE(err.str().find("Unknown command: global-test nope"), std::string::npos);

    EXPECT_FALSE(unregisterCommand({"global-test", "ping"}));
    EXPECT_EQ(run(std::vector<std::string>{"global-test", "ping"}), 1);
    setTransport(previous);
}
