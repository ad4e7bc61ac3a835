#include <gtest/gtest.h>
#include <chat/output_relay.hpp>
#include <core/debug_log.hpp>
#include <chrono>
#include <sstream>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

class OutputRelayTest : public ::testing::Test {
protected:
    int fds[2] = {-1, -1};
    RawOutputQueue queue;

    void SetUp() override {
        ASSERT_EQ(pipe(fds), 0);
    }

    void TearDown() override {
        close_writer();
        if (fds[0] >= 0) ::close(fds[0]);
    }

    void write_all(const std::string& s) {
        ASSERT_EQ(::write(fds[1], s.data(), s.size()), static_cast<ssize_t>(s.size()));
    }

    void close_writer() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

TEST(RawOutputQueue, PopTimesOutWhenEmpty) {
    RawOutputQueue q;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop(30ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(RawOutputQueue, FifoAndDrain) {
    RawOutputQueue q;
    q.push("a");
    q.push("b");
    q.push("c");
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(*q.pop(0ms), "a");
    EXPECT_EQ(q.drain(), 2u);
    EXPECT_EQ(q.size(), 0u);
}

TEST(RawOutputQueue, PopWakesOnPush) {
    RawOutputQueue q;
    std::thread producer([&q] {
        std::this_thread::sleep_for(20ms);
        q.push("late");
    });
    auto chunk = q.pop(2000ms);
    producer.join();
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(*chunk, "late");
}

TEST_F(OutputRelayTest, SplitsLinesInOrder) {
    OutputRelay relay(fds[0], queue);
    relay.start();

    write_all("one\ntwo\nthree\n");
    EXPECT_EQ(queue.pop(1000ms).value_or(""), "one\n");
    EXPECT_EQ(queue.pop(1000ms).value_or(""), "two\n");
    EXPECT_EQ(queue.pop(1000ms).value_or(""), "three\n");
    relay.stop();
}

TEST_F(OutputRelayTest, FlushesPartialLineWhenQuiet) {
    OutputRelay relay(fds[0], queue);
    relay.start();

    write_all("reply\n> ");
    EXPECT_EQ(queue.pop(1000ms).value_or(""), "reply\n");
    EXPECT_EQ(queue.pop(1000ms).value_or(""), "> ");
    relay.stop();
}

TEST_F(OutputRelayTest, EndOfStreamStopsThread) {
    OutputRelay relay(fds[0], queue);
    relay.start();
    EXPECT_TRUE(relay.running());

    write_all("tail without newline");
    close_writer();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (relay.running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(relay.running());
    EXPECT_EQ(queue.pop(100ms).value_or(""), "tail without newline");
    EXPECT_FALSE(queue.pop(50ms).has_value());
    relay.stop();
}

TEST_F(OutputRelayTest, MirrorsChunksToDebugLog) {
    auto stream = std::make_unique<std::ostringstream>();
    std::ostringstream* sink = stream.get();
    DebugLog log(std::move(stream));

    OutputRelay relay(fds[0], queue, &log);
    relay.start();
    write_all("mirrored line\n");
    ASSERT_TRUE(queue.pop(1000ms).has_value());
    relay.stop();

    EXPECT_EQ(sink->str(), "mirrored line\n");
}

TEST_F(OutputRelayTest, StopIsIdempotent) {
    OutputRelay relay(fds[0], queue);
    relay.start();
    relay.stop();
    relay.stop();
    SUCCEED();
}
