// test_frame.cpp
#include <gtest/gtest.h>
#include "frame.hpp"
#include "../errors.hpp"

using muxbridge::ProtocolError;
using muxbridge::io::Frame;
using muxbridge::io::FrameReader;
using muxbridge::io::controlFrame;
using muxbridge::io::encodeFrame;

TEST(FrameCodec, EncodesLengthOfChannelAndPayload) {
    EXPECT_EQ(encodeFrame(Frame{ "4", "foo" }), "5\n4\nfoo");
    EXPECT_EQ(encodeFrame(Frame{ "", "{}" }), "3\n\n{}");
}

TEST(FrameCodec, ControlFrameCarriesJson) {
    Frame f = controlFrame({ {"command", "ping"} });
    EXPECT_TRUE(f.isControl());
    EXPECT_EQ(nlohmann::json::parse(f.payload)["command"], "ping");
}

TEST(FrameCodec, ReassemblesFramesSplitAcrossReads) {
    const std::string wire = encodeFrame(Frame{ "ch1", "hello" })
                           + encodeFrame(Frame{ "", "{\"command\":\"ping\"}" });
    FrameReader reader;
    std::vector<Frame> frames;
    for (char c : wire) {
        reader.feed(&c, 1);
        Frame f;
        while (reader.next(f))
            frames.push_back(f);
    }
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].channel, "ch1");
    EXPECT_EQ(frames[0].payload, "hello");
    EXPECT_TRUE(frames[1].isControl());
    EXPECT_EQ(reader.buffered(), 0u);
    EXPECT_NO_THROW(reader.finish());
}

TEST(FrameCodec, ManyFramesInOneRead) {
    FrameReader reader;
    reader.feed("2\na\n2\nb\n3\nc\nx");
    Frame f;
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f.channel, "a");
    EXPECT_EQ(f.payload, "");
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f.channel, "b");
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f.channel, "c");
    EXPECT_EQ(f.payload, "x");
    EXPECT_FALSE(reader.next(f));
}

TEST(FrameCodec, PayloadMayContainNewlinesAndBinary) {
    const std::string payload("a\nb\0c", 5);
    FrameReader reader;
    reader.feed(encodeFrame(Frame{ "7", payload }));
    Frame f;
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f.payload, payload);
}

TEST(FrameCodec, RejectsMalformedHeaders) {
    {
        FrameReader r;
        r.feed("x\n");
        Frame f;
        EXPECT_THROW(r.next(f), ProtocolError);
    }
    {
        FrameReader r;
        r.feed("12345678901\n");
        Frame f;
        EXPECT_THROW(r.next(f), ProtocolError);
    }
    {
        FrameReader r;
        r.feed("0\n");
        Frame f;
        EXPECT_THROW(r.next(f), ProtocolError);
    }
    {
        FrameReader r;
        r.feed("\n");
        Frame f;
        EXPECT_THROW(r.next(f), ProtocolError);
    }
    {
        FrameReader r;
        r.feed("3\nabc");   // no channel separator
        Frame f;
        EXPECT_THROW(r.next(f), ProtocolError);
    }
}

TEST(FrameCodec, TruncatedFrameAtEofIsAnError) {
    FrameReader reader;
    reader.feed("10\nch\nabc");
    Frame f;
    EXPECT_FALSE(reader.next(f));
    EXPECT_THROW(reader.finish(), ProtocolError);
}
