#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "clink/dispatch.hpp"
#include "test_support.hpp"

using namespace clink;

namespace {

Match matchFor(Handler handler) {
    Match m;
    m.entry.pattern = CommandPattern::fromTokens({"admin", "status"});
    m.entry.handler = std::move(handler);
    m.path = {"admin", "status"};
    return m;
}

ParsedArgs withGlobals(GlobalFlags globals) {
    return ParsedArgs({}, {}, {}, std::move(globals));
}

} // namespace

TEST(ExecuteTest, HandlerReceivesPathAndArgs) {
    std::vector<std::string> seenPath;
    const auto m = matchFor([&seenPath](const std::vector<std::string>& path, const ParsedArgs& args) {
        seenPath = path;
        return Result{Status{}.text(args.getKey<std::string>("node"))};
    });
    ParsedArgs::ValueMap keys;
    keys["node"] = std::string("dev1");
    const auto result = execute(m, ParsedArgs(keys, {}, {}, {}));
    EXPECT_EQ(seenPath, (std::vector<std::string>{"admin", "status"}));
    EXPECT_EQ(std::get<Text>(std::get<Status>(result).elements().front()).text, "dev1");
}

TEST(ExecuteTest, ThrownExceptionBecomesHandlerError) {
    const auto m = matchFor([](const std::vector<std::string>&, const ParsedArgs&) -> Result {
        throw std::runtime_error("disk on fire");
    });
    const auto result = execute(m, ParsedArgs{});
    ASSERT_TRUE(std::holds_alternative<Error>(result));
    EXPECT_EQ(std::get<Error>(result).kind, ErrorKind::Handler);
    EXPECT_EQ(std::get<Error>(result).message, "disk on fire");
}

TEST(ExecuteTest, NonStandardThrowBecomesHandlerError) {
    const auto m = matchFor([](const std::vector<std::string>&, const ParsedArgs&) -> Result { throw 42; });
    Result result;
    EXPECT_NO_THROW(result = execute(m, ParsedArgs{}));
    ASSERT_TRUE(std::holds_alternative<Error>(result));
    EXPECT_EQ(std::get<Error>(result).kind, ErrorKind::Handler);
    EXPECT_EQ(std::get<Error>(result).message, "handler failed");
}

TEST(ExecuteTest, BareStatusIsTaggedWithRequestedFormat) {
    const auto m = matchFor([](const std::vector<std::string>&, const ParsedArgs&) { return Result{Status{}}; });
    GlobalFlags globals;
    globals.format = "json";
    const auto result = execute(m, withGlobals(globals));
    ASSERT_TRUE(std::holds_alternative<TaggedStatus>(result));
    EXPECT_EQ(std::get<TaggedStatus>(result).format, "json");
    EXPECT_EQ(std::get<TaggedStatus>(result).exitCode, 0);

    EXPECT_TRUE(std::holds_alternative<Status>(execute(m, ParsedArgs{})));
}

TEST(ExecuteTest, HandlerChosenFormatWins) {
    const auto m = matchFor(
        [](const std::vector<std::string>&, const ParsedArgs&) { return exitStatus(2, Status{}, "csv"); });
    GlobalFlags globals;
    globals.format = "json";
    const auto result = execute(m, withGlobals(globals));
    ASSERT_TRUE(std::holds_alternative<TaggedStatus>(result));
    EXPECT_EQ(std::get<TaggedStatus>(result).format, "csv");
    EXPECT_EQ(std::get<TaggedStatus>(result).exitCode, 2);
}

class TargetNodesTest : public ::testing::Test {
protected:
    std::vector<std::string> nodes(const GlobalFlags& globals) {
        auto result = targetNodes(registry, cluster, globals);
        if (auto* err = std::get_if<Error>(&result)) {
            ADD_FAILURE() << err->message;
            return {};
        }
        return std::get<std::vector<std::string>>(result);
    }

    Registry registry;
    test::FakeCluster cluster{"dev1", {"dev2", "dev3"}};
};

TEST_F(TargetNodesTest, DefaultsToLocalNode) {
    EXPECT_EQ(nodes({}), (std::vector<std::string>{"dev1"}));
}

TEST_F(TargetNodesTest, NodeFlagPicksOneNode) {
    GlobalFlags g;
    g.node = "dev3";
    EXPECT_EQ(nodes(g), (std::vector<std::string>{"dev3"}));
}

TEST_F(TargetNodesTest, AllUsesNodeFinder) {
    registry.registerNodeFinder([] { return std::vector<std::string>{"dev1", "dev2", "dev3"}; });
    GlobalFlags g;
    g.all = true;
    EXPECT_EQ(nodes(g), (std::vector<std::string>{"dev1", "dev2", "dev3"}));
}

TEST_F(TargetNodesTest, AllWithoutFinderIsLocal) {
    GlobalFlags g;
    g.all = true;
    EXPECT_EQ(nodes(g), (std::vector<std::string>{"dev1"}));
}

TEST_F(TargetNodesTest, AllAndNodeConflict) {
    GlobalFlags g;
    g.all = true;
    g.node = "dev2";
    const auto result = targetNodes(registry, cluster, g);
    ASSERT_TRUE(std::holds_alternative<Error>(result));
    EXPECT_EQ(std::get<Error>(result).kind, ErrorKind::Validation);
}

TEST_F(TargetNodesTest, EmptyFinderIsAnError) {
    registry.registerNodeFinder([] { return std::vector<std::string>{}; });
    GlobalFlags g;
    g.all = true;
    EXPECT_TRUE(std::holds_alternative<Error>(targetNodes(registry, cluster, g)));
}

TEST(FanOutTest, CollectsPerNodeOutcomes) {
    test::FakeCluster cluster("dev1", {"dev2", "dev3"});
    std::vector<std::string> callers;
    for (const auto& node : {"dev1", "dev2", "dev3"}) {
        cluster.expose(node, "ping", [node, &callers](const std::vector<std::string>& args) -> RemoteResult {
            callers.push_back(CallContext::callingNode().value_or("?"));
            return std::vector<std::string>{std::string(node) + ":" + args.at(0)};
        });
    }
    cluster.setDown("dev3");

    const auto outcomes = fanOut(cluster, {"dev1", "dev2", "dev3"}, "ping", {"hi"});
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(std::get<std::vector<std::string>>(outcomes[1].result), (std::vector<std::string>{"dev2:hi"}));
    EXPECT_TRUE(std::holds_alternative<Error>(outcomes[2].result));
    EXPECT_EQ(callers, (std::vector<std::string>{"dev1", "dev1"}));

    const auto alert = failedNodes(outcomes);
    ASSERT_TRUE(alert.has_value());
    const auto& list = std::get<List>(alert->content.front());
    EXPECT_EQ(list.title, "Failed on the following nodes");
    EXPECT_EQ(list.values, (std::vector<std::string>{"dev3: Node dev3 is unreachable"}));
}

TEST(FanOutTest, NoAlertWhenEveryNodeAnswers) {
    test::FakeCluster cluster("dev1", {});
    cluster.expose("dev1", "ping", [](const std::vector<std::string>&) -> RemoteResult {
        return std::vector<std::string>{};
    });
    EXPECT_FALSE(failedNodes(fanOut(cluster, {"dev1"}, "ping", {})).has_value());
}

TEST(LocalTransportTest, CallsExposedFunctionsOnItself) {
    LocalTransport transport("solo");
    transport.expose("echo", [](const std::vector<std::string>& args) -> RemoteResult {
        return std::vector<std::string>{CallContext::callingNode().value_or("?"), args.at(0)};
    });
    const auto ok = transport.call("solo", "echo", {"x"});
    EXPECT_EQ(std::get<std::vector<std::string>>(ok), (std::vector<std::string>{"solo", "x"}));
    EXPECT_TRUE(std::holds_alternative<Error>(transport.call("other", "echo", {"x"})));
    EXPECT_TRUE(std::holds_alternative<Error>(transport.call("solo", "missing", {})));
    EXPECT_FALSE(transport.whereisStandardError("other").has_value());
}
