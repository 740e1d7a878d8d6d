#include "../frame_codec.H"

#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace tickpipe;
using namespace framing;

namespace {

std::vector<std::string> decode_in_chunks(const std::string& bytes, size_t chunk_size) {
    FrameDecoder decoder;
    std::vector<std::string> frames;
    std::string frame;
    for (size_t i = 0; i < bytes.size(); i += chunk_size) {
        size_t len = std::min(chunk_size, bytes.size() - i);
        decoder.push(bytes.data() + i, len);
        while (decoder.pop(frame)) {
            frames.push_back(frame);
        }
    }
    return frames;
}

} // namespace

TEST(FrameCodecTest, EncodeAppendsDelimiter) {
    EXPECT_EQ(encode("AAPL,150.00"), "AAPL,150.00*");
    EXPECT_EQ(encode(""), "*");
}

TEST(FrameCodecTest, RoundTripAnyChunking) {
    std::string payload;
    for (int i = 0; i < 10; ++i) {
        payload += "A very long message with lots of text";
    }
    std::string bytes = encode(payload);

    for (size_t chunk_size = 1; chunk_size <= bytes.size() + 1; ++chunk_size) {
        auto frames = decode_in_chunks(bytes, chunk_size);
        ASSERT_EQ(frames.size(), 1) << "chunk size " << chunk_size;
        EXPECT_EQ(frames[0], payload);
    }
}

TEST(FrameCodecTest, MultipleFramesKeepOrder) {
    std::vector<std::string> payloads = {"AAPL,150.00", "MSFT,320.50", "", "42", "{\"side\":\"BUY\"}"};
    std::string bytes;
    for (const auto& payload : payloads) {
        bytes += encode(payload);
    }

    for (size_t chunk_size = 1; chunk_size <= bytes.size(); ++chunk_size) {
        EXPECT_EQ(decode_in_chunks(bytes, chunk_size), payloads) << "chunk size " << chunk_size;
    }
}

TEST(FrameCodecTest, PartialFrameStaysBuffered) {
    FrameDecoder decoder;
    std::string frame;

    decoder.push("GOOGL,1", 7);
    EXPECT_FALSE(decoder.pop(frame));
    EXPECT_EQ(decoder.buffered(), 7);
    EXPECT_EQ(decoder.pending(), "GOOGL,1");

    decoder.push("01.25*AMZ", 9);
    ASSERT_TRUE(decoder.pop(frame));
    EXPECT_EQ(frame, "GOOGL,101.25");
    EXPECT_FALSE(decoder.pop(frame));
    EXPECT_EQ(decoder.pending(), "AMZ");
}

// The legacy gateway joined SYMBOL,PRICE records with the frame delimiter
// inside one payload. The stream decoder cannot tell those apart from frame
// boundaries, so such a payload arrives as several frames.
TEST(FrameCodecTest, DelimiterInsidePayloadSplitsFrame) {
    std::string bytes = encode("AAPL,150.00*MSFT,320.50");
    auto frames = decode_in_chunks(bytes, 4);

    ASSERT_EQ(frames.size(), 2);
    EXPECT_EQ(frames[0], "AAPL,150.00");
    EXPECT_EQ(frames[1], "MSFT,320.50");
}

TEST(FrameCodecTest, SplitRecords) {
    auto records = split_records("AAPL,150.00*MSFT,320.50**");
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0], "AAPL,150.00");
    EXPECT_EQ(records[1], "MSFT,320.50");

    EXPECT_TRUE(split_records("").empty());
    EXPECT_EQ(split_records("42"), std::vector<std::string>{"42"});
}

class FrameReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override {
        if (fds[0] != -1) close(fds[0]);
        if (fds[1] != -1) close(fds[1]);
    }

    void close_writer() {
        close(fds[1]);
        fds[1] = -1;
    }

    int fds[2] = {-1, -1};
    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger();
};

TEST_F(FrameReaderTest, ReadsFramesUntilClose) {
    ASSERT_TRUE(send_frame(fds[1], "AAPL,150.00"));
    ASSERT_TRUE(send_frame(fds[1], "MSFT,320.50"));
    close_writer();

    FrameReader reader(fds[0], logger, 3);
    std::string frame;
    ASSERT_EQ(reader.next(frame), READ_STATUS::FRAME);
    EXPECT_EQ(frame, "AAPL,150.00");
    ASSERT_EQ(reader.next(frame), READ_STATUS::FRAME);
    EXPECT_EQ(frame, "MSFT,320.50");
    EXPECT_EQ(reader.next(frame), READ_STATUS::CLOSED);
    EXPECT_TRUE(reader.finished());
}

TEST_F(FrameReaderTest, ReportsIncompleteFrameOnClose) {
    ASSERT_TRUE(send_frame(fds[1], "55"));
    ASSERT_TRUE(send_all(fds[1], "6", 1));
    close_writer();

    FrameReader reader(fds[0], logger);
    std::string frame;
    ASSERT_EQ(reader.next(frame), READ_STATUS::FRAME);
    EXPECT_EQ(frame, "55");
    EXPECT_EQ(reader.next(frame), READ_STATUS::INCOMPLETE);

    // not restartable
    EXPECT_EQ(reader.next(frame), READ_STATUS::CLOSED);
}

TEST_F(FrameReaderTest, TimesOutWithoutData) {
    struct timeval tv = {0, 20000};
    ASSERT_EQ(setsockopt(fds[0], SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)), 0);

    FrameReader reader(fds[0], logger);
    std::string frame;
    EXPECT_EQ(reader.next(frame), READ_STATUS::TIMEOUT);
    EXPECT_FALSE(reader.finished());

    ASSERT_TRUE(send_frame(fds[1], "17"));
    ASSERT_EQ(reader.next(frame), READ_STATUS::FRAME);
    EXPECT_EQ(frame, "17");
}

TEST_F(FrameReaderTest, SendToClosedPeerFails) {
    close(fds[0]);
    fds[0] = -1;

    EXPECT_FALSE(send_frame(fds[1], "AAPL,150.00"));
    EXPECT_EQ(errno, EPIPE);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
