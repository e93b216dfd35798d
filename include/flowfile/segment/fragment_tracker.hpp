#pragma once

#include "flowfile/core/attributes.hpp"
#include "flowfile/core/result.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace flowfile::segment {

/**
 * @brief Tracks which fragments of each parent have been saved
 *
 * Arrivals are keyed by fragment.identifier and recorded by fragment.index,
 * so a fragment delivered twice (a replayed POST) counts once. landed()
 * reports true exactly when the last missing index of a parent arrives; the
 * parent is then forgotten. Thread-safe.
 */
class FragmentTracker {
public:
    /// Malformed when fragment.identifier, fragment.index or fragment.count is unusable.
    Result<bool> landed(const AttributeSet& attrs);

    /// Parents with at least one fragment recorded and some still missing.
    std::size_t pending() const;

private:
    struct Parent {
        std::uint64_t count = 0;
        std::set<std::uint64_t> indices;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Parent> parents_;
};

} // namespace flowfile::segment
