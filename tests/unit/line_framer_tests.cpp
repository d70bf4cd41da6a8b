#include "toolbridge/transport/line_framer.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace toolbridge::transport;
using namespace toolbridge::types;
using json = nlohmann::json;

TEST(LineFramerTest, EncodeAppendsSingleNewline) {
  JSONRPCRequest request{.id = std::int64_t{1},
                         .method = "tools/call",
                         .params = json{{"text", "two\nlines"}}};

  std::string line = LineFramer::encode(request);

  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  EXPECT_EQ(line.find('\n'), line.size() - 1);
  EXPECT_EQ(json::parse(line)["params"]["text"], "two\nlines");
}

TEST(LineFramerTest, SplitsChunksIntoLines) {
  LineFramer framer;

  auto lines = framer.feed("{\"a\":1}\n{\"b\"");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "{\"a\":1}");
  EXPECT_GT(framer.buffered(), 0u);

  lines = framer.feed(":2}\n");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "{\"b\":2}");
  EXPECT_EQ(framer.buffered(), 0u);
}

TEST(LineFramerTest, StripsCarriageReturnAndSkipsBlankLines) {
  LineFramer framer;

  auto lines = framer.feed("first\r\n\n   \r\nsecond\n");

  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "first");
  EXPECT_EQ(lines[1], "second");
}

TEST(LineFramerTest, DropsOverlongLineUntilNextNewline) {
  LineFramer framer(8);

  auto lines = framer.feed("0123456789");
  EXPECT_TRUE(lines.empty());
  EXPECT_EQ(framer.droppedLines(), 1u);

  lines = framer.feed("more tail\nok\n");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "ok");
  EXPECT_EQ(framer.droppedLines(), 1u);
}

TEST(LineFramerTest, FinishFlushesUnterminatedTail) {
  LineFramer framer;

  EXPECT_TRUE(framer.feed("{\"tail\":true}").empty());

  auto tail = framer.finish();
  ASSERT_TRUE(tail.has_value());
  EXPECT_EQ(*tail, "{\"tail\":true}");
  EXPECT_FALSE(framer.finish().has_value());
}
