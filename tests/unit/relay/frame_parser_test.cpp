#include <gtest/gtest.h>

#include "chatraw/relay/frame_parser.hpp"
#include "common/utilities_test.hpp"

using chatraw::relay::FrameKind;
using chatraw::relay::FrameParser;
using chatraw::relay::LineBuffer;
using chatraw_tests::TestUtilities;

namespace {

std::string firstLine(const std::string& event) {
  return event.substr(0, event.find('\n'));
}

} // namespace

TEST(FrameParserTest, ParsesContentDelta) {
  auto frame = FrameParser::parse(firstLine(TestUtilities::sseDelta("Hello")), false);

  EXPECT_EQ(frame.kind, FrameKind::Delta);
  EXPECT_EQ(frame.content, "Hello");
  EXPECT_TRUE(frame.reasoning.empty());
}

TEST(FrameParserTest, AcceptsDataPrefixWithoutSpace) {
  auto frame = FrameParser::parse("data:{\"choices\":[{\"delta\":{\"content\":\"x\"}}]}\r", false);

  EXPECT_EQ(frame.kind, FrameKind::Delta);
  EXPECT_EQ(frame.content, "x");
}

TEST(FrameParserTest, RecognizesDoneSentinel) {
  EXPECT_EQ(FrameParser::parse("data: [DONE]", false).kind, FrameKind::Done);
  EXPECT_EQ(FrameParser::parse("data:[DONE]  ", true).kind, FrameKind::Done);
}

TEST(FrameParserTest, SkipsNonDataAndUndecodableLines) {
  EXPECT_EQ(FrameParser::parse("", false).kind, FrameKind::Skip);
  EXPECT_EQ(FrameParser::parse(": keep-alive", false).kind, FrameKind::Skip);
  EXPECT_EQ(FrameParser::parse("event: message", false).kind, FrameKind::Skip);
  EXPECT_EQ(FrameParser::parse("data: {not json", false).kind, FrameKind::Skip);
  EXPECT_EQ(FrameParser::parse("data: {\"choices\":[]}", false).kind, FrameKind::Skip);
  EXPECT_EQ(FrameParser::parse("data: {\"choices\":[{\"finish_reason\":\"stop\"}]}", false).kind, FrameKind::Skip);
  EXPECT_EQ(FrameParser::parse("data: {\"choices\":[{\"delta\":{}}]}", false).kind, FrameKind::Skip);
}

TEST(FrameParserTest, ReadsReasoningOnlyWhenRequested) {
  const std::string line = firstLine(TestUtilities::sseDelta("", "pondering"));

  EXPECT_EQ(FrameParser::parse(line, false).kind, FrameKind::Skip);

  auto frame = FrameParser::parse(line, true);
  EXPECT_EQ(frame.kind, FrameKind::Delta);
  EXPECT_EQ(frame.reasoning, "pondering");
}

TEST(FrameParserTest, ChecksReasoningFieldsInOrder) {
  for (const auto& field : FrameParser::reasoningFields()) {
    auto frame = FrameParser::parse(firstLine(TestUtilities::sseDelta("", "r-" + field, field)), true);
    EXPECT_EQ(frame.reasoning, "r-" + field);
  }

  nlohmann::json delta = {{"reasoning", "second"}, {"reasoning_content", "first"}, {"thinking", "third"}};
  EXPECT_EQ(FrameParser::fromMessage(delta, true).reasoning, "first");
}

TEST(FrameParserTest, NullContentIsIgnored) {
  auto frame = FrameParser::fromMessage({{"content", nullptr}, {"reasoning_content", "r"}}, true);

  EXPECT_EQ(frame.kind, FrameKind::Delta);
  EXPECT_TRUE(frame.content.empty());
  EXPECT_EQ(frame.reasoning, "r");
}

TEST(LineBufferTest, ReassemblesLinesSplitAcrossChunks) {
  LineBuffer buffer;

  auto first = buffer.feed("data: one\nda", 12);
  auto second = buffer.feed("ta: two\n\nrest", 13);

  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0], "data: one");
  ASSERT_EQ(second.size(), 2u);
  EXPECT_EQ(second[0], "data: two");
  EXPECT_EQ(second[1], "");

  auto tail = buffer.flush();
  ASSERT_TRUE(tail.has_value());
  EXPECT_EQ(*tail, "rest");
  EXPECT_FALSE(buffer.flush().has_value());
}

TEST(LineBufferTest, KeepsMultibyteSequencesIntact) {
  const std::string line = "data: {\"choices\":[{\"delta\":{\"content\":\"\xE4\xBD\xA0\xE5\xA5\xBD\"}}]}\n";
  LineBuffer buffer;

  // Split inside the first UTF-8 sequence
  const size_t cut = line.find('\xE4') + 1;
  EXPECT_TRUE(buffer.feed(line.data(), cut).empty());
  auto lines = buffer.feed(line.data() + cut, line.size() - cut);

  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(FrameParser::parse(lines[0], false).content, "\xE4\xBD\xA0\xE5\xA5\xBD");
}
