#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace flowfile {

/**
 * @brief Histogram of transferred FlowFile sizes
 *
 * A size lands in the first bucket whose bound is greater than it; sizes at
 * or past the last bound land in the overflow bucket. Counters are atomic so
 * receiver threads can record concurrently.
 */
class TransferMetrics {
public:
    /// 100, 250, 1e3, 2.5e3 ... 2.5e8, 1e9
    static std::vector<std::uint64_t> default_bounds();

    explicit TransferMetrics(std::vector<std::uint64_t> bounds = default_bounds());

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    void record(std::uint64_t size);

    const std::vector<std::uint64_t>& bounds() const noexcept { return bounds_; }
    std::size_t bucket_count() const noexcept { return bounds_.size() + 1; }
    std::uint64_t bucket(std::size_t index) const;
    std::uint64_t sum() const noexcept { return sum_.load(); }
    std::uint64_t count() const noexcept { return count_.load(); }

    void connection_opened() noexcept { ++active_; }
    void connection_closed() noexcept { --active_; ++finished_; }
    std::int64_t active_connections() const noexcept { return active_.load(); }

    /// {"started_ms", "sum", "count", "active", "finished", "buckets": [{"le", "count"}]}
    nlohmann::json snapshot() const;

private:
    std::vector<std::uint64_t> bounds_;
    std::unique_ptr<std::atomic<std::uint64_t>[]> buckets_;
    std::atomic<std::uint64_t> sum_{0};
    std::atomic<std::uint64_t> count_{0};
    std::atomic<std::int64_t> active_{0};
    std::atomic<std::uint64_t> finished_{0};
    std::chrono::system_clock::time_point started_;
};

} // namespace flowfile
