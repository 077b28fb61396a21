#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mcplink/http/sse_parser.h"

namespace mcplink {
namespace http {
namespace {

class RecordingCallbacks : public SseParserCallbacks {
 public:
  void onSseEvent(const SseEvent& event) override { events.push_back(event); }
  void onSseComment(const std::string& comment) override {
    comments.push_back(comment);
  }

  std::vector<SseEvent> events;
  std::vector<std::string> comments;
};

class SseParserTest : public ::testing::Test {
 protected:
  RecordingCallbacks callbacks_;
  SseParser parser_{callbacks_};
};

TEST_F(SseParserTest, DispatchesOnBlankLine) {
  parser_.feed("event: message\nid: 7\ndata: {\"id\":\"r1\"}\n");
  EXPECT_TRUE(callbacks_.events.empty());
  parser_.feed("\n");

  ASSERT_EQ(1u, callbacks_.events.size());
  const SseEvent& event = callbacks_.events[0];
  EXPECT_EQ("{\"id\":\"r1\"}", event.data);
  EXPECT_EQ("message", event.event.value_or(""));
  EXPECT_EQ("7", event.id.value_or(""));
}

TEST_F(SseParserTest, JoinsDataLines) {
  parser_.feed("data: first\ndata:second\ndata\n\n");
  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_EQ("first\nsecond\n", callbacks_.events[0].data);
}

TEST_F(SseParserTest, OnlyOneLeadingSpaceIsStripped) {
  parser_.feed("data:  indented\n\n");
  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_EQ(" indented", callbacks_.events[0].data);
}

TEST_F(SseParserTest, AcceptsAllLineEndings) {
  parser_.feed("data: lf\n\n");
  parser_.feed("data: cr\r\r");
  parser_.feed("data: crlf\r\n\r\n");

  ASSERT_EQ(3u, callbacks_.events.size());
  EXPECT_EQ("lf", callbacks_.events[0].data);
  EXPECT_EQ("cr", callbacks_.events[1].data);
  EXPECT_EQ("crlf", callbacks_.events[2].data);
}

TEST_F(SseParserTest, CrlfSplitAcrossChunks) {
  parser_.feed("data: a\r");
  parser_.feed("\ndata: b\r");
  parser_.feed("\n\r");
  parser_.feed("\n");

  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_EQ("a\nb", callbacks_.events[0].data);
}

TEST_F(SseParserTest, SkipsByteOrderMark) {
  parser_.feed("\xEF\xBB\xBF" "data: x\n\n");
  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_EQ("x", callbacks_.events[0].data);
}

TEST_F(SseParserTest, SkipsByteOrderMarkSplitAcrossChunks) {
  parser_.feed("\xEF");
  parser_.feed("\xBB");
  parser_.feed("\xBF" "da");
  parser_.feed("ta: y\n\n");
  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_EQ("y", callbacks_.events[0].data);
}

TEST_F(SseParserTest, CommentsAreReported) {
  parser_.feed(": keepalive\n\n");
  EXPECT_TRUE(callbacks_.events.empty());
  ASSERT_EQ(1u, callbacks_.comments.size());
  EXPECT_EQ(" keepalive", callbacks_.comments[0]);
}

TEST_F(SseParserTest, EventsWithoutDataAreNotDispatched) {
  parser_.feed("event: ping\nid: 3\n\n");
  EXPECT_TRUE(callbacks_.events.empty());
  EXPECT_EQ("3", parser_.lastEventId());

  parser_.feed("data: next\n\n");
  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_FALSE(callbacks_.events[0].event.has_value());
}

TEST_F(SseParserTest, LastEventIdPersists) {
  parser_.feed("id: 41\ndata: a\n\ndata: b\n\n");
  ASSERT_EQ(2u, callbacks_.events.size());
  EXPECT_EQ("41", callbacks_.events[1].id.value_or(""));

  parser_.reset();
  EXPECT_EQ("41", parser_.lastEventId());
}

TEST_F(SseParserTest, RetryMustBeDigits) {
  parser_.feed("retry: 2500\ndata: a\n\n");
  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_EQ(2500u, callbacks_.events[0].retry.value_or(0));
  EXPECT_EQ(2500u, parser_.retry().value_or(0));

  parser_.feed("retry: soon\nretry: 99999999999999999999999\ndata: b\n\n");
  ASSERT_EQ(2u, callbacks_.events.size());
  EXPECT_FALSE(callbacks_.events[1].retry.has_value());
  EXPECT_EQ(2500u, parser_.retry().value_or(0));
}

TEST_F(SseParserTest, UnknownFieldsAreIgnored) {
  parser_.feed("foo: bar\ndata: z\n\n");
  ASSERT_EQ(1u, callbacks_.events.size());
  EXPECT_EQ("z", callbacks_.events[0].data);
}

TEST_F(SseParserTest, ByteByByteMatchesWholeInput) {
  const std::string stream =
      "\xEF\xBB\xBF" ": hello\r\nid: 1\r\ndata: {\"a\":1}\r\n\r\n"
      "event: update\ndata: line1\ndata: line2\n\n";
  for (char c : stream) {
    parser_.feed(&c, 1);
  }
  ASSERT_EQ(2u, callbacks_.events.size());
  EXPECT_EQ("{\"a\":1}", callbacks_.events[0].data);
  EXPECT_EQ("line1\nline2", callbacks_.events[1].data);
  EXPECT_EQ("update", callbacks_.events[1].event.value_or(""));
  EXPECT_EQ(1u, callbacks_.comments.size());
}

TEST_F(SseParserTest, ResetDropsPartialEvent) {
  parser_.feed("data: partial\n");
  parser_.reset();
  parser_.feed("\n");
  EXPECT_TRUE(callbacks_.events.empty());
}

}  // namespace
}  // namespace http
}  // namespace mcplink
