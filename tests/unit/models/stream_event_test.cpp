#include <gtest/gtest.h>

#include <cmath>

#include "chatraw/models/stream_event.hpp"

using namespace chatraw;

TEST(StreamEventTest, SerializesEachEventAsOneJsonLine) {
  EXPECT_EQ(eventToNdjson(ChatIdEvent{"abc"}), "{\"chat_id\":\"abc\"}\n");
  EXPECT_EQ(eventToNdjson(ContentDeltaEvent{"Hi"}), "{\"content\":\"Hi\"}\n");
  EXPECT_EQ(eventToNdjson(ThinkingDeltaEvent{"hmm"}), "{\"thinking\":\"hmm\"}\n");
  EXPECT_EQ(eventToNdjson(ErrorEvent{"boom"}), "{\"error\":\"boom\"}\n");
  EXPECT_EQ(eventToNdjson(DoneEvent{}), "{\"done\":true}\n");
}

TEST(StreamEventTest, ReferencesCarryContentAndScore) {
  auto j = eventToJson(ReferencesEvent{{retrieval::Candidate("text", 0.5f)}});

  ASSERT_TRUE(j["references"].is_array());
  EXPECT_EQ(j["references"][0]["content"], "text");
  EXPECT_DOUBLE_EQ(j["references"][0]["score"].get<double>(), 0.5);
}

TEST(StreamEventTest, ReferenceScoresAreWrittenWithTwoDecimals) {
  const float rounded = std::round(0.8712f * 100.0f) / 100.0f;

  const std::string line = eventToNdjson(ReferencesEvent{{retrieval::Candidate("x", rounded)}});

  EXPECT_EQ(line, "{\"references\":[{\"content\":\"x\",\"score\":0.87}]}\n");
  EXPECT_NE(eventToNdjson(ReferencesEvent{{retrieval::Candidate("y", 0.333333f)}}).find("\"score\":0.33}"),
            std::string::npos);
}

TEST(StreamEventTest, InvalidUtf8IsReplaced) {
  const std::string line = eventToNdjson(ContentDeltaEvent{std::string("bad \xFF byte")});

  EXPECT_NE(line.find("\xEF\xBF\xBD"), std::string::npos);
  EXPECT_EQ(line.back(), '\n');
}

TEST(StreamEventTest, OnlyDoneAndErrorAreTerminal) {
  EXPECT_TRUE(isTerminal(DoneEvent{}));
  EXPECT_TRUE(isTerminal(ErrorEvent{"x"}));
  EXPECT_FALSE(isTerminal(ContentDeltaEvent{"x"}));
  EXPECT_FALSE(isTerminal(ChatIdEvent{"x"}));
}
