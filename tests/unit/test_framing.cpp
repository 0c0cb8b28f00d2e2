#include <gtest/gtest.h>
#include "toolbridge/framing.hpp"
#include "toolbridge/error.hpp"

using namespace toolbridge;

namespace {

void feed(FrameDecoder& d, const std::string& s) {
    d.feed(s.data(), s.size());
}

} // namespace

TEST(Framing, NamesRoundTrip) {
    EXPECT_EQ(framing_from_string("newline"), Framing::Newline);
    EXPECT_EQ(framing_from_string("content-length"), Framing::ContentLength);
    EXPECT_EQ(framing_from_string("xml"), std::nullopt);
    EXPECT_EQ(to_string(Framing::ContentLength), "content-length");
}

TEST(Framing, EncodeNewline) {
    EXPECT_EQ(encode_frame(Framing::Newline, R"({"a":1})"), "{\"a\":1}\n");
}

TEST(Framing, EncodeContentLength) {
    EXPECT_EQ(encode_frame(Framing::ContentLength, "hello"), "Content-Length: 5\r\n\r\nhello");
}

TEST(NewlineDecoder, SplitsAcrossChunks) {
    FrameDecoder d(Framing::Newline);
    feed(d, "{\"a\"");
    EXPECT_FALSE(d.next().has_value());
    feed(d, ":1}\n{\"b\":2}\n{\"c\"");
    EXPECT_EQ(d.next(), "{\"a\":1}");
    EXPECT_EQ(d.next(), "{\"b\":2}");
    EXPECT_FALSE(d.next().has_value());
    EXPECT_EQ(d.buffered(), 4u);
}

TEST(NewlineDecoder, StripsCarriageReturnAndSkipsBlankLines) {
    FrameDecoder d(Framing::Newline);
    feed(d, "\n\r\n{\"x\":1}\r\n\n");
    EXPECT_EQ(d.next(), "{\"x\":1}");
    EXPECT_FALSE(d.next().has_value());
}

TEST(NewlineDecoder, OversizeLineIsFatal) {
    FrameDecoder d(Framing::Newline, 16);
    feed(d, std::string(32, 'x'));
    EXPECT_THROW((void)d.next(), TransportError);
}

TEST(ContentLengthDecoder, SingleFrame) {
    FrameDecoder d(Framing::ContentLength);
    feed(d, "Content-Length: 7\r\n\r\n{\"a\":1}");
    EXPECT_EQ(d.next(), "{\"a\":1}");
    EXPECT_EQ(d.buffered(), 0u);
}

TEST(ContentLengthDecoder, PartialBodyWaits) {
    FrameDecoder d(Framing::ContentLength);
    feed(d, "Content-Length: 7\r\n\r\n{\"a\"");
    EXPECT_FALSE(d.next().has_value());
    feed(d, ":1}Content-Length: 2\r\n\r\n{}");
    EXPECT_EQ(d.next(), "{\"a\":1}");
    EXPECT_EQ(d.next(), "{}");
}

TEST(ContentLengthDecoder, HeaderNameIsCaseInsensitiveAndExtraHeadersIgnored) {
    FrameDecoder d(Framing::ContentLength);
    feed(d, "content-type: application/json\r\ncontent-LENGTH:  2 \r\n\r\n[]");
    EXPECT_EQ(d.next(), "[]");
}

TEST(ContentLengthDecoder, BadHeaderBlockIsDroppedAndStreamContinues) {
    FrameDecoder d(Framing::ContentLength);
    feed(d, "Content-Length: abc\r\n\r\nContent-Length: 2\r\n\r\n{}");
    EXPECT_EQ(d.next(), "{}");
}

TEST(ContentLengthDecoder, MissingLengthIsDropped) {
    FrameDecoder d(Framing::ContentLength);
    feed(d, "X-Other: 1\r\n\r\nContent-Length: 2\r\n\r\n{}");
    EXPECT_EQ(d.next(), "{}");
}

TEST(ContentLengthDecoder, OversizeFrameIsFatal) {
    FrameDecoder d(Framing::ContentLength, 10);
    feed(d, "Content-Length: 11\r\n\r\n");
    EXPECT_THROW((void)d.next(), TransportError);
}

TEST(ContentLengthDecoder, ResetDiscardsBufferedBytes) {
    FrameDecoder d(Framing::ContentLength);
    feed(d, "Content-Length: 10\r\n\r\nabc");
    EXPECT_FALSE(d.next().has_value());
    d.reset();
    EXPECT_EQ(d.buffered(), 0u);
    feed(d, "Content-Length: 1\r\n\r\nz");
    EXPECT_EQ(d.next(), "z");
}
