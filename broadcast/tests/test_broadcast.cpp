#include "../broadcast_hub.H"
#include "common/utils.H"
#include "framing/frame_codec.H"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <dirent.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <regex>
#include <thread>

using namespace tickpipe;
using namespace hub;

namespace {

int subscribe(uint16_t port) {
    int fd = connect_tcp("127.0.0.1", port);
    if (fd != -1) {
        struct timeval tv = {2, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
    return fd;
}

std::vector<std::string> read_frames(int fd, size_t count) {
    framing::FrameReader reader(fd, spdlog::default_logger());
    std::vector<std::string> frames;
    std::string frame;
    while (frames.size() < count && reader.next(frame) == framing::READ_STATUS::FRAME) {
        frames.push_back(frame);
    }
    return frames;
}

size_t open_fd_count() {
    size_t count = 0;
    DIR* dir = opendir("/proc/self/fd");
    if (dir == nullptr) {
        return 0;
    }
    while (readdir(dir) != nullptr) {
        count++;
    }
    closedir(dir);
    return count;
}

pipeline_config loopback_config() {
    pipeline_config config;
    config.price_port = 0;
    config.news_port = 0;
    config.price_interval_ms = 20;
    config.news_interval_ms = 20;
    return config;
}

} // namespace

TEST(PriceGeneratorTest, StartsWithinRange) {
    RandomWalkPriceGenerator walk({"AAPL", "MSFT", "GOOGL", "AMZN"}, 42);
    ASSERT_EQ(walk.current().size(), 4);
    EXPECT_EQ(walk.current()[2].symbol, "GOOGL");
    for (const auto& update : walk.current()) {
        EXPECT_GE(update.price, 100.0);
        EXPECT_LE(update.price, 300.0);
    }
}

TEST(PriceGeneratorTest, StepsAreBounded) {
    RandomWalkPriceGenerator walk({"AAPL", "MSFT"}, 7);
    auto before = walk.current();
    for (int i = 0; i < 1000; i++) {
        const auto& after = walk.step();
        for (size_t s = 0; s < after.size(); s++) {
            EXPECT_LE(std::abs(after[s].price - before[s].price), 0.5 + 1e-9);
        }
        before = after;
    }
}

TEST(PriceGeneratorTest, PriceNeverDropsBelowFloor) {
    auto walk = RandomWalkPriceGenerator::from_prices({{"PENNY", 0.01}, {"DIME", 0.10}}, 99);
    for (int i = 0; i < 5000; i++) {
        for (const auto& update : walk.step()) {
            ASSERT_GE(update.price, 0.01);
        }
    }
}

TEST(PriceGeneratorTest, FormatsTwoDecimals) {
    EXPECT_EQ(format_price_record({"AAPL", 150.0}), "AAPL,150.00");
    EXPECT_EQ(format_price_record({"MSFT", 301.456}), "MSFT,301.46");
    EXPECT_EQ(format_price_record({"AMZN", 0.01}), "AMZN,0.01");
}

TEST(PriceGeneratorTest, SentimentWithinRange) {
    SentimentGenerator sentiment(3);
    for (int i = 0; i < 1000; i++) {
        int value = sentiment.next();
        EXPECT_GE(value, 0);
        EXPECT_LE(value, 100);
    }
}

class BroadcastChannelTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (int fd : clients) {
            close(fd);
        }
    }

    int add_subscriber() {
        int fd = subscribe(channel.port());
        EXPECT_NE(fd, -1);
        EXPECT_TRUE(channel.accept_pending(1000));
        clients.push_back(fd);
        return fd;
    }

    BroadcastChannel channel{"test", "127.0.0.1", 0, spdlog::default_logger()};
    std::vector<int> clients;
};

TEST_F(BroadcastChannelTest, BindsEphemeralPort) {
    EXPECT_NE(channel.port(), 0);
    EXPECT_EQ(channel.subscriber_count(), 0);
    EXPECT_FALSE(channel.accept_pending(10));
}

TEST_F(BroadcastChannelTest, NoSubscribersDeliversNothing) {
    EXPECT_EQ(channel.broadcast(framing::encode("42")), 0);
}

TEST_F(BroadcastChannelTest, ReachesEverySubscriber) {
    for (int i = 0; i < 3; i++) {
        add_subscriber();
    }
    ASSERT_EQ(channel.subscriber_count(), 3);

    EXPECT_EQ(channel.broadcast(framing::encode("55")), 3);

    for (int fd : clients) {
        auto frames = read_frames(fd, 1);
        ASSERT_EQ(frames.size(), 1);
        EXPECT_EQ(frames[0], "55");
    }
}

TEST_F(BroadcastChannelTest, PrunesClosedSubscriberAndKeepsOthers) {
    add_subscriber();
    int leaving = add_subscriber();
    add_subscriber();

    close(leaving);
    clients.erase(std::find(clients.begin(), clients.end(), leaving));
    size_t fds_before = open_fd_count();

    // the first send to a closed peer can still succeed; the reset it
    // provokes fails the next cycle
    std::vector<std::string> sent;
    for (int i = 0; i < 50 && channel.subscriber_count() == 3; i++) {
        sent.push_back(std::to_string(i));
        EXPECT_GE(channel.broadcast(framing::encode(sent.back())), 2);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(channel.subscriber_count(), 2);
    EXPECT_EQ(open_fd_count(), fds_before - 1);

    sent.push_back("last");
    EXPECT_EQ(channel.broadcast(framing::encode(sent.back())), 2);
    EXPECT_EQ(channel.subscriber_count(), 2);

    for (int fd : clients) {
        EXPECT_EQ(read_frames(fd, sent.size()), sent);
    }
}

TEST_F(BroadcastChannelTest, HalfClosedSubscriberStillReceives) {
    int reader_fd = add_subscriber();
    ASSERT_EQ(shutdown(reader_fd, SHUT_WR), 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(channel.broadcast(framing::encode("7")), 1);
    EXPECT_EQ(channel.broadcast(framing::encode("8")), 1);
    EXPECT_EQ(channel.subscriber_count(), 1);
    EXPECT_EQ(read_frames(reader_fd, 2), (std::vector<std::string>{"7", "8"}));
}

TEST(BroadcastChannelSetupTest, BindConflictThrows) {
    BroadcastChannel first("first", "127.0.0.1", 0, spdlog::default_logger());
    EXPECT_THROW(BroadcastChannel("second", "127.0.0.1", first.port(), spdlog::default_logger()), std::runtime_error);
}

TEST(BroadcastChannelSetupTest, InvalidHostThrows) {
    EXPECT_THROW(BroadcastChannel("bad", "not-an-ip", 0, spdlog::default_logger()), std::runtime_error);
}

TEST(BroadcastHubTest, PriceTickSendsOneFramePerSymbol) {
    auto config = loopback_config();
    BroadcastHub hub(config, spdlog::default_logger());

    EXPECT_EQ(hub.price_tick(), 0);

    int fd = subscribe(hub.price_channel().port());
    ASSERT_NE(fd, -1);
    ASSERT_TRUE(hub.price_channel().accept_pending(1000));

    EXPECT_EQ(hub.price_tick(), 1);
    EXPECT_EQ(hub.price_ticks(), 2);

    auto frames = read_frames(fd, config.symbols.size());
    ASSERT_EQ(frames.size(), config.symbols.size());

    std::regex record("^([A-Z]+),([0-9]+\\.[0-9]{2})$");
    for (size_t i = 0; i < frames.size(); i++) {
        std::smatch match;
        ASSERT_TRUE(std::regex_match(frames[i], match, record)) << frames[i];
        EXPECT_EQ(match[1], config.symbols[i]);
    }
    close(fd);
}

TEST(BroadcastHubTest, NewsTickSendsSentiment) {
    BroadcastHub hub(loopback_config(), spdlog::default_logger());

    int fd = subscribe(hub.news_channel().port());
    ASSERT_NE(fd, -1);
    ASSERT_TRUE(hub.news_channel().accept_pending(1000));

    EXPECT_EQ(hub.news_tick(), 1);

    auto frames = read_frames(fd, 1);
    ASSERT_EQ(frames.size(), 1);
    int value = std::stoi(frames[0]);
    EXPECT_GE(value, 0);
    EXPECT_LE(value, 100);
    close(fd);
}

TEST(BroadcastHubTest, RunStreamsUntilStopped) {
    BroadcastHub hub(loopback_config(), spdlog::default_logger());
    std::atomic<bool> running{true};
    std::thread runner([&] { hub.run(running); });

    int price_fd = subscribe(hub.price_channel().port());
    int news_fd = subscribe(hub.news_channel().port());
    ASSERT_NE(price_fd, -1);
    ASSERT_NE(news_fd, -1);

    EXPECT_EQ(read_frames(price_fd, 8).size(), 8);
    EXPECT_EQ(read_frames(news_fd, 2).size(), 2);

    // readable while the ticker thread is still writing it
    EXPECT_GE(hub.price_ticks(), 2);

    running = false;
    runner.join();
    EXPECT_GT(hub.price_ticks(), 0);

    close(price_fd);
    close(news_fd);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
