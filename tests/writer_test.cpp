#include <gtest/gtest.h>

#include <string>

#include "clink/writer.hpp"

using namespace clink;

namespace {

Status nodeTable() {
    Status s;
    s.table({
        Row{{"node", "dev1"}, {"state", "up"}},
        Row{{"node", "dev22"}, {"state", "down"}},
    });
    return s;
}

} // namespace

TEST(HumanWriterTest, TextAndLists) {
    Status s;
    s.text("hello").list("Nodes", {"a", "b"}).list("", {"c"});
    const auto out = humanWriter(s);
    EXPECT_EQ(out.out, "hello\nNodes:\n  a\n  b\nc\n");
    EXPECT_TRUE(out.err.empty());
}

TEST(HumanWriterTest, TablesAreAlignedGrids) {
    const auto out = humanWriter(nodeTable());
    EXPECT_EQ(out.out,
              "+-------+-------+\n"
              "| node  | state |\n"
              "+-------+-------+\n"
              "| dev1  | up    |\n"
              "| dev22 | down  |\n"
              "+-------+-------+\n");
}

TEST(HumanWriterTest, AlertsGoToStderr) {
    Status s;
    s.text("done").alert({Text{"careful"}, List{"Nodes", {"n1"}}});
    const auto out = humanWriter(s);
    EXPECT_EQ(out.out, "done\n");
    EXPECT_EQ(out.err, "careful\nNodes:\n  n1\n");
}

TEST(HumanWriterTest, EmptyStatusRendersNothing) {
    const auto out = humanWriter(Status{});
    EXPECT_TRUE(out.out.empty());
    EXPECT_TRUE(out.err.empty());
}

TEST(JsonWriterTest, ElementsAsArray) {
    Status s;
    s.text("say \"hi\"\n").list("L", {"x"});
    const auto out = jsonWriter(s);
    EXPECT_EQ(out.out,
              "[{\"type\":\"text\",\"text\":\"say \\\"hi\\\"\\n\"},"
              "{\"type\":\"list\",\"title\":\"L\",\"values\":[\"x\"]}]\n");
    EXPECT_TRUE(out.err.empty());
}

TEST(JsonWriterTest, TableRowsAreObjects) {
    Status s;
    s.table({Row{{"node", "dev1"}, {"state", "up"}}});
    EXPECT_EQ(jsonWriter(s).out, "[{\"type\":\"table\",\"rows\":[{\"node\":\"dev1\",\"state\":\"up\"}]}]\n");
}

TEST(JsonWriterTest, AlertsAreSeparateArrayOnStderr) {
    Status s;
    s.alert({Text{"bad"}});
    const auto out = jsonWriter(s);
    EXPECT_EQ(out.out, "[]\n");
    EXPECT_EQ(out.err, "[{\"type\":\"text\",\"text\":\"bad\"}]\n");
}

TEST(JsonWriterTest, EscapesControlCharacters) {
    EXPECT_EQ(writer::jsonEscape(std::string("a\tb\x01", 4)), "a\\tb\\u0001");
    EXPECT_EQ(writer::jsonEscape("back\\slash"), "back\\\\slash");
}

TEST(CsvWriterTest, TableWithHeader) {
    const auto out = csvWriter(nodeTable());
    EXPECT_EQ(out.out, "node,state\r\ndev1,up\r\ndev22,down\r\n");
}

TEST(CsvWriterTest, QuotesFieldsThatNeedIt) {
    Status s;
    s.table({Row{{"name", "a,b"}, {"note", "say \"x\""}}});
    EXPECT_EQ(csvWriter(s).out, "name,note\r\n\"a,b\",\"say \"\"x\"\"\"\r\n");
    EXPECT_EQ(writer::csvField("plain"), "plain");
}

TEST(CsvWriterTest, ListsAndTextAndAlerts) {
    Status s;
    s.text("header").list("ignored title", {"a", "b"}).alert({Text{"oops"}});
    const auto out = csvWriter(s);
    EXPECT_EQ(out.out, "header\na,b\r\n");
    EXPECT_EQ(out.err, "oops\n");
}
