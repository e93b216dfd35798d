#include "flowfile/network/latency_writer.hpp"
#include "flowfile/network/pipe.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

using namespace flowfile::network;
using flowfile::Error;
using flowfile::ErrorCode;
using flowfile::VectorSink;

namespace {

flowfile::Result<void> put(flowfile::OutputSink& out, const std::string& text) {
    return out.write(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::string drain(BytePipe& pipe) {
    std::string out;
    std::uint8_t buf[4];
    while (true) {
        auto got = pipe.read(buf, sizeof(buf));
        if (got.is_error() || got.value() == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf), got.value());
    }
    return out;
}

// Sink whose writes are observable from another thread.
class RecordingSink : public flowfile::OutputSink {
public:
    flowfile::Result<void> write(const std::uint8_t* data, std::size_t len) override {
        std::lock_guard lock(mutex_);
        data_.append(reinterpret_cast<const char*>(data), len);
        ++writes_;
        return flowfile::Ok();
    }

    std::string data() const {
        std::lock_guard lock(mutex_);
        return data_;
    }

    int writes() const {
        std::lock_guard lock(mutex_);
        return writes_;
    }

private:
    mutable std::mutex mutex_;
    std::string data_;
    int writes_ = 0;
};

class FailingSink : public flowfile::OutputSink {
public:
    flowfile::Result<void> write(const std::uint8_t*, std::size_t) override {
        return flowfile::Err<void>(ErrorCode::Transport, "peer went away");
    }
};

} // namespace

TEST(BytePipeTest, DeliversInOrderThenEnds) {
    BytePipe pipe(4);
    ASSERT_TRUE(put(pipe, "hello ").is_ok());
    ASSERT_TRUE(put(pipe, "pipe").is_ok());
    EXPECT_EQ(pipe.queued(), 2u);
    pipe.close();
    EXPECT_EQ(drain(pipe), "hello pipe");

    auto late = put(pipe, "x");
    ASSERT_TRUE(late.is_error());
    EXPECT_TRUE(late.error().is(ErrorCode::Closed));
}

TEST(BytePipeTest, WriterBlocksUntilReaderCatchesUp) {
    BytePipe pipe(1);
    ASSERT_TRUE(put(pipe, "a").is_ok());

    std::atomic<bool> second_written{false};
    std::thread writer([&] {
        EXPECT_TRUE(put(pipe, "b").is_ok());
        second_written = true;
        pipe.close();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(second_written.load());
    EXPECT_EQ(drain(pipe), "ab");
    writer.join();
    EXPECT_TRUE(second_written.load());
}

TEST(BytePipeTest, WriterErrorReachesReader) {
    BytePipe pipe;
    ASSERT_TRUE(put(pipe, "partial").is_ok());
    pipe.close_with_error(Error(ErrorCode::Terminated, "stop"));

    std::uint8_t buf[16];
    auto got = pipe.read(buf, sizeof(buf));
    ASSERT_TRUE(got.is_error());
    EXPECT_TRUE(got.error().is(ErrorCode::Terminated));
}

TEST(BytePipeTest, ReaderFailureUnblocksWriter) {
    BytePipe pipe(1);
    ASSERT_TRUE(put(pipe, "fill").is_ok());

    std::thread reader([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        pipe.fail_reader(Error(ErrorCode::Transport, "connection reset"));
    });
    auto blocked = put(pipe, "more");
    reader.join();
    ASSERT_TRUE(blocked.is_error());
    EXPECT_TRUE(blocked.error().is(ErrorCode::Transport));
}

TEST(LatencyWriterTest, FlushesWhenBufferFills) {
    VectorSink sink;
    LatencyWriter writer(sink, 4, std::chrono::milliseconds(0));
    ASSERT_TRUE(put(writer, "abcdef").is_ok());
    EXPECT_EQ(sink.str(), "abcd");
    EXPECT_EQ(writer.buffered(), 2u);

    ASSERT_TRUE(writer.close().is_ok());
    EXPECT_EQ(sink.str(), "abcdef");
    EXPECT_EQ(writer.buffered(), 0u);
    EXPECT_TRUE(writer.close().is_ok());
}

TEST(LatencyWriterTest, FlushesAfterLatency) {
    RecordingSink sink;
    LatencyWriter writer(sink, 1024, std::chrono::milliseconds(20));
    ASSERT_TRUE(put(writer, "small").is_ok());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (sink.data().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(sink.data(), "small");
    EXPECT_EQ(writer.buffered(), 0u);
    ASSERT_TRUE(writer.close().is_ok());
    EXPECT_EQ(sink.writes(), 1);
}

TEST(LatencyWriterTest, AbandonDropsBufferedBytes) {
    VectorSink sink;
    LatencyWriter writer(sink, 1024, std::chrono::milliseconds(1000));
    ASSERT_TRUE(put(writer, "never sent").is_ok());
    writer.abandon();
    EXPECT_EQ(writer.buffered(), 0u);
    EXPECT_TRUE(sink.data().empty());
}

TEST(LatencyWriterTest, DestinationErrorIsSticky) {
    FailingSink sink;
    LatencyWriter writer(sink, 2, std::chrono::milliseconds(0));
    auto first = put(writer, "abc");
    ASSERT_TRUE(first.is_error());
    EXPECT_TRUE(first.error().is(ErrorCode::Transport));

    auto second = put(writer, "d");
    ASSERT_TRUE(second.is_error());
    EXPECT_TRUE(writer.flush().is_error());
}
