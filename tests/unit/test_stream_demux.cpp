#include <gtest/gtest.h>
#include "stream_demux.h"
#include "errors.h"

namespace gradebox {
namespace {

class RecordingSink : public LogSink {
public:
    void on_stdout(const char* data, size_t len) override { out.append(data, len); }
    void on_stderr(const char* data, size_t len) override { err.append(data, len); }

    std::string out;
    std::string err;
};

std::string frame(uint8_t stream, const std::string& payload) {
    std::string f(8, '\0');
    f[0] = static_cast<char>(stream);
    uint32_t size = static_cast<uint32_t>(payload.size());
    f[4] = static_cast<char>((size >> 24) & 0xff);
    f[5] = static_cast<char>((size >> 16) & 0xff);
    f[6] = static_cast<char>((size >> 8) & 0xff);
    f[7] = static_cast<char>(size & 0xff);
    return f + payload;
}

// ============================================================================
// Docker Frame Demultiplexing
// ============================================================================

TEST(DockerFrameDemuxerTest, SeparatesStdoutAndStderr) {
    RecordingSink sink;
    DockerFrameDemuxer demux(sink);

    std::string data = frame(1, "PASS test_a\n") + frame(2, "warning: slow\n") + frame(1, "PASS test_b\n");
    demux.feed(data.data(), data.size());

    EXPECT_EQ(sink.out, "PASS test_a\nPASS test_b\n");
    EXPECT_EQ(sink.err, "warning: slow\n");
    EXPECT_FALSE(demux.has_partial());
}

TEST(DockerFrameDemuxerTest, HandlesFramesSplitAtEveryByte) {
    RecordingSink sink;
    DockerFrameDemuxer demux(sink);

    std::string data = frame(1, "hello ") + frame(2, "oops") + frame(1, "world");
    for (char c : data) {
        demux.feed(&c, 1);
    }

    EXPECT_EQ(sink.out, "hello world");
    EXPECT_EQ(sink.err, "oops");
}

TEST(DockerFrameDemuxerTest, ReportsPartialFrame) {
    RecordingSink sink;
    DockerFrameDemuxer demux(sink);

    std::string data = frame(1, "truncated payload");
    demux.feed(data.data(), 12);
    EXPECT_TRUE(demux.has_partial());
    demux.feed(data.data() + 12, data.size() - 12);
    EXPECT_FALSE(demux.has_partial());
    EXPECT_EQ(sink.out, "truncated payload");
}

TEST(DockerFrameDemuxerTest, LargeFrameSizeIsBigEndian) {
    RecordingSink sink;
    DockerFrameDemuxer demux(sink);

    std::string payload(70000, 'x');
    std::string data = frame(1, payload);
    demux.feed(data.data(), data.size());
    EXPECT_EQ(sink.out.size(), 70000u);
}

TEST(DockerFrameDemuxerTest, DropsStdinAndEmptyFrames) {
    RecordingSink sink;
    DockerFrameDemuxer demux(sink);

    std::string data = frame(0, "typed input") + frame(1, "") + frame(1, "out");
    demux.feed(data.data(), data.size());
    EXPECT_EQ(sink.out, "out");
    EXPECT_TRUE(sink.err.empty());
}

TEST(DockerFrameDemuxerTest, UnknownStreamTypeThrows) {
    RecordingSink sink;
    DockerFrameDemuxer demux(sink);

    std::string data = frame(7, "bad");
    EXPECT_THROW(demux.feed(data.data(), data.size()), SandboxError);
}

// ============================================================================
// Chunked Transfer Decoding
// ============================================================================

TEST(ChunkedDecoderTest, DecodesChunksAndTrailer) {
    std::string body;
    ChunkedDecoder decoder([&body](const char* d, size_t n) { body.append(d, n); });

    std::string wire = "5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n";
    decoder.feed(wire.data(), wire.size());

    EXPECT_EQ(body, "hello, world");
    EXPECT_TRUE(decoder.done());
}

TEST(ChunkedDecoderTest, HandlesByteByByteInput) {
    std::string body;
    ChunkedDecoder decoder([&body](const char* d, size_t n) { body.append(d, n); });

    std::string wire = "a\r\n0123456789\r\n3\r\nabc\r\n0\r\nX-Trailer: 1\r\n\r\n";
    for (char c : wire) {
        ASSERT_FALSE(decoder.done());
        decoder.feed(&c, 1);
    }
    EXPECT_EQ(body, "0123456789abc");
    EXPECT_TRUE(decoder.done());
}

TEST(ChunkedDecoderTest, IgnoresBytesAfterDone) {
    std::string body;
    ChunkedDecoder decoder([&body](const char* d, size_t n) { body.append(d, n); });

    std::string wire = "2\r\nok\r\n0\r\n\r\ngarbage";
    decoder.feed(wire.data(), wire.size());
    EXPECT_EQ(body, "ok");
    EXPECT_TRUE(decoder.done());
}

TEST(ChunkedDecoderTest, MalformedInputThrows) {
    ChunkedDecoder bad_size([](const char*, size_t) {});
    std::string wire = "zz\r\n";
    EXPECT_THROW(bad_size.feed(wire.data(), wire.size()), SandboxError);

    ChunkedDecoder missing_crlf([](const char*, size_t) {});
    std::string wire2 = "2\r\nokXX\r\n";
    EXPECT_THROW(missing_crlf.feed(wire2.data(), wire2.size()), SandboxError);
}

} // namespace
} // namespace gradebox
