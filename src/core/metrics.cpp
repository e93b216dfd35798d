#include "flowfile/core/metrics.hpp"

#include <algorithm>

namespace flowfile {

std::vector<std::uint64_t> TransferMetrics::default_bounds() {
    return {100, 250, 1000,
            2500, 10000, 25000, 100000,
            250000, 1000000, 2500000, 10000000,
            25000000, 100000000, 250000000, 1000000000};
}

TransferMetrics::TransferMetrics(std::vector<std::uint64_t> bounds)
    : bounds_(std::move(bounds))
    , buckets_(new std::atomic<std::uint64_t>[bounds_.size() + 1])
    , started_(std::chrono::system_clock::now()) {
    std::sort(bounds_.begin(), bounds_.end());
    for (std::size_t i = 0; i < bucket_count(); ++i) {
        buckets_[i].store(0);
    }
}

void TransferMetrics::record(std::uint64_t size) {
    const auto it = std::upper_bound(bounds_.begin(), bounds_.end(), size);
    ++buckets_[static_cast<std::size_t>(it - bounds_.begin())];
    sum_ += size;
    ++count_;
}

std::uint64_t TransferMetrics::bucket(std::size_t index) const {
    return index < bucket_count() ? buckets_[index].load() : 0;
}

nlohmann::json TransferMetrics::snapshot() const {
    nlohmann::json j;
    j["started_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        started_.time_since_epoch()).count();
    j["sum"] = sum();
    j["count"] = count();
    j["active"] = active_connections();
    j["finished"] = finished_.load();
    j["buckets"] = nlohmann::json::array();
    for (std::size_t i = 0; i < bucket_count(); ++i) {
        nlohmann::json b;
        if (i < bounds_.size()) {
            b["le"] = bounds_[i];
        } else {
            b["le"] = "+Inf";
        }
        b["count"] = bucket(i);
        j["buckets"].push_back(b);
    }
    return j;
}

} // namespace flowfile
