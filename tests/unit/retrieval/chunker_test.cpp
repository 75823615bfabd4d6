#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

#include "chatraw/retrieval/chunker.hpp"
#include "chatraw/utf8.hpp"

using chatraw::retrieval::Chunker;

TEST(ChunkerTest, EmptyInputYieldsNoChunks) {
  EXPECT_TRUE(Chunker::chunk("", 100, 10).empty());
}

TEST(ChunkerTest, RejectsNonPositiveChunkSize) {
  EXPECT_THROW(Chunker::chunk("text", 0, 0), std::invalid_argument);
  EXPECT_THROW(Chunker::chunk("text", -5, 0), std::invalid_argument);
}

TEST(ChunkerTest, ShortParagraphsShareOneChunk) {
  auto chunks = Chunker::chunk("alpha\n\nbeta", 100, 10);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "alpha\n\nbeta");
}

TEST(ChunkerTest, FlushesWhenNextParagraphWouldOverflow) {
  auto chunks = Chunker::chunk("aaaa\n\nbbbb", 8, 0);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "aaaa");
  EXPECT_EQ(chunks[1], "bbbb");
}

TEST(ChunkerTest, FlushedTailSeedsTheNextChunk) {
  auto chunks = Chunker::chunk("abcdefgh\n\nijklmnop", 12, 3);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "abcdefgh");
  // Last three code points of "abcdefgh\n\n" carry over
  EXPECT_EQ(chunks[1], "h\n\n ijklmnop");
}

TEST(ChunkerTest, SkipsBlankParagraphs) {
  auto chunks = Chunker::chunk("\n\n  one  \n\n\n\n\t\n\ntwo\n\n", 100, 0);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "one\n\ntwo");
}

TEST(ChunkerTest, ForceSplitsLongParagraphWithOverlapStride) {
  auto chunks = Chunker::chunk("abcdefghij", 4, 1);

  std::vector<std::string> expected = {"abcd", "defg", "ghij", "j"};
  EXPECT_EQ(chunks, expected);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chatraw::utf8::length(chunk), 4u);
  }
}

TEST(ChunkerTest, PendingBufferIsFlushedBeforeForceSplit) {
  auto chunks = Chunker::chunk("short\n\nabcdefghijkl", 5, 0);

  std::vector<std::string> expected = {"short", "abcde", "fghij", "kl"};
  EXPECT_EQ(chunks, expected);
}

TEST(ChunkerTest, OverlapNotSmallerThanSizeStillAdvances) {
  auto pieces = Chunker::forceSplit("abc", 2, 5);

  std::vector<std::string> expected = {"ab", "bc", "c"};
  EXPECT_EQ(pieces, expected);
}

TEST(ChunkerTest, CountsCodePointsNotBytes) {
  auto chunks = Chunker::chunk("h\xC3\xA9llo w\xC3\xB6rld", 5, 0);

  std::vector<std::string> expected = {"h\xC3\xA9llo", " w\xC3\xB6rl", "d"};
  EXPECT_EQ(chunks, expected);
}

TEST(ChunkerTest, ForceSplitCoversEveryCharacter) {
  const std::string text = "The quick brown fox jumps over the lazy dog";
  const int size = 10;
  const int overlap = 3;
  const size_t stride = static_cast<size_t>(size - overlap);

  auto pieces = Chunker::forceSplit(text, size, overlap);

  std::string rebuilt;
  for (size_t i = 0; i < pieces.size(); ++i) {
    EXPECT_LE(pieces[i].size(), static_cast<size_t>(size));
    EXPECT_EQ(pieces[i], text.substr(i * stride, size));
    const std::string fresh = pieces[i].substr(0, std::min(stride, pieces[i].size()));
    rebuilt += (i + 1 < pieces.size()) ? fresh : pieces[i];
  }
  EXPECT_EQ(rebuilt.substr(0, text.size()), text);
}
