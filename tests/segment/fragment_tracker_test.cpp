#include "flowfile/checksum/checksum.hpp"
#include "flowfile/network/receiver.hpp"
#include "flowfile/network/transaction.hpp"
#include "flowfile/segment/fragment_tracker.hpp"
#include "flowfile/segment/save.hpp"
#include "flowfile/segment/segmenter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using flowfile::AttributeSet;
using flowfile::ErrorCode;
using flowfile::File;
using flowfile::Result;
using flowfile::segment::FragmentTracker;

namespace {

AttributeSet fragment_attrs(const std::string& identifier, int index, int count) {
    AttributeSet attrs;
    attrs.set("fragment.identifier", identifier)
        .set("fragment.index", std::to_string(index))
        .set("fragment.count", std::to_string(count));
    return attrs;
}

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() / fs::path("flowfile_tracker_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST(FragmentTrackerTest, CompletesWhenEveryIndexLanded) {
    FragmentTracker tracker;
    EXPECT_FALSE(tracker.landed(fragment_attrs("p", 3, 3)).value());
    EXPECT_FALSE(tracker.landed(fragment_attrs("p", 1, 3)).value());
    EXPECT_EQ(tracker.pending(), 1u);
    EXPECT_TRUE(tracker.landed(fragment_attrs("p", 2, 3)).value());
    EXPECT_EQ(tracker.pending(), 0u);
}

TEST(FragmentTrackerTest, RepeatedFragmentCountsOnce) {
    FragmentTracker tracker;
    EXPECT_FALSE(tracker.landed(fragment_attrs("p", 1, 2)).value());
    EXPECT_FALSE(tracker.landed(fragment_attrs("p", 1, 2)).value());
    EXPECT_EQ(tracker.pending(), 1u);
    EXPECT_TRUE(tracker.landed(fragment_attrs("p", 2, 2)).value());
}

TEST(FragmentTrackerTest, ParentsAreIndependent) {
    FragmentTracker tracker;
    EXPECT_FALSE(tracker.landed(fragment_attrs("a", 1, 2)).value());
    EXPECT_FALSE(tracker.landed(fragment_attrs("b", 1, 2)).value());
    EXPECT_TRUE(tracker.landed(fragment_attrs("b", 2, 2)).value());
    EXPECT_EQ(tracker.pending(), 1u);
}

TEST(FragmentTrackerTest, RejectsUnusableAttributes) {
    FragmentTracker tracker;
    const std::vector<AttributeSet> bad = {
        fragment_attrs("", 1, 2),
        fragment_attrs("p", 0, 2),
        fragment_attrs("p", 3, 2),
        fragment_attrs("p", 1, 0),
        AttributeSet().set("fragment.identifier", "p").set("fragment.index", "x").set("fragment.count", "2"),
    };
    for (const auto& attrs : bad) {
        auto res = tracker.landed(attrs);
        ASSERT_TRUE(res.is_error());
        EXPECT_TRUE(res.error().is(ErrorCode::Malformed));
    }

    ASSERT_TRUE(tracker.landed(fragment_attrs("p", 1, 2)).is_ok());
    auto changed = tracker.landed(fragment_attrs("p", 2, 3));
    ASSERT_TRUE(changed.is_error());
    EXPECT_TRUE(changed.error().is(ErrorCode::Malformed));
}

TEST(FragmentTrackerTest, ConcurrentArrivalsCompleteOnce) {
    FragmentTracker tracker;
    constexpr int kCount = 64;
    std::atomic<int> completions{0};
    std::vector<std::thread> threads;
    for (int i = 1; i <= kCount; ++i) {
        threads.emplace_back([&, i] {
            for (int repeat = 0; repeat < 2; ++repeat) {
                if (tracker.landed(fragment_attrs("p", i, kCount)).value()) {
                    ++completions;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(completions.load(), 1);
}

// A fragment saved before a failed response is replayed by the sender's retry;
// the parent is checked only after the other fragment arrives.
TEST(FragmentTrackerTest, ReplayedFragmentDoesNotTriggerEarlyParentCheck) {
    const auto dir = create_temp_dir();
    flowfile::SaveOptions save_options;
    save_options.reassembly_attempts = 2;
    save_options.reassembly_delay = std::chrono::milliseconds(5);

    flowfile::checksum::ChecksumEngine checksums;
    FragmentTracker tracker;
    std::atomic<int> deliveries{0};
    std::mutex mutex;
    std::vector<int> checked_at;
    std::vector<bool> check_passed;

    flowfile::ReceiverOptions receiver_options;
    receiver_options.address = "127.0.0.1";
    receiver_options.port = 0;
    flowfile::network::Receiver receiver(receiver_options);
    receiver.set_file_handler([&](File& file, const flowfile::network::RequestInfo&) -> Result<void> {
        auto saved = flowfile::segment::save(file, dir, save_options);
        if (saved.is_error()) {
            return flowfile::Err<void>(saved.error());
        }
        const int delivery = ++deliveries;
        auto complete = tracker.landed(file.attrs());
        if (complete.is_error()) {
            return flowfile::Err<void>(complete.error());
        }
        if (complete.value()) {
            auto verified = checksums.verify_parent(saved.value(), file.attrs());
            std::lock_guard lock(mutex);
            checked_at.push_back(delivery);
            check_passed.push_back(verified.is_ok());
        }
        if (delivery == 1) {
            return flowfile::Err<void>(ErrorCode::Io, "response lost");
        }
        return flowfile::Ok();
    });
    ASSERT_TRUE(receiver.start().is_ok());

    std::string content;
    for (int i = 0; i < 500; ++i) {
        content += "row " + std::to_string(i) + "\n";
    }
    File parent = File::from_string(content);
    parent.attrs().set("path", "./").set("filename", "replayed.txt");
    ASSERT_TRUE(checksums.add_checksum(parent, "SHA256").is_ok());
    auto fragments = flowfile::segment::segment_by_size(parent, content.size() / 2 + 1);
    ASSERT_TRUE(fragments.is_ok());
    auto& parts = fragments.value();
    ASSERT_EQ(parts.size(), 2u);

    flowfile::TransactionOptions options;
    options.retries = 1;
    options.retry_delay = std::chrono::milliseconds(10);
    options.flush_interval = std::chrono::milliseconds(20);
    flowfile::network::Transaction transaction(
        "http://127.0.0.1:" + std::to_string(receiver.port()) + "/contentListener", options);
    ASSERT_TRUE(transaction.handshake().is_ok());

    auto first = transaction.send(parts[0]);
    ASSERT_TRUE(first.is_ok()) << first.error().describe();
    EXPECT_EQ(deliveries.load(), 2);
    {
        std::lock_guard lock(mutex);
        EXPECT_TRUE(checked_at.empty());
    }

    auto second = transaction.send(parts[1]);
    ASSERT_TRUE(second.is_ok()) << second.error().describe();
    receiver.stop();

    EXPECT_EQ(checked_at, (std::vector<int>{3}));
    EXPECT_EQ(check_passed, (std::vector<bool>{true}));
    EXPECT_EQ(tracker.pending(), 0u);
    fs::remove_all(dir);
}
