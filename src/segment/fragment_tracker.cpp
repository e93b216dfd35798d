#include "flowfile/segment/fragment_tracker.hpp"

#include <spdlog/spdlog.h>

#include <charconv>

namespace flowfile::segment {
namespace {

Result<std::uint64_t> parse_count(const AttributeSet& attrs, const char* name) {
    const std::string text = attrs.get(name);
    std::uint64_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc() && end == text.data() + text.size() && value > 0) {
        return Ok(value);
    }
    return Err<std::uint64_t>(ErrorCode::Malformed, std::string("Invalid ") + name + ": \"" + text + "\"");
}

} // namespace

Result<bool> FragmentTracker::landed(const AttributeSet& attrs) {
    const std::string identifier = attrs.get(attr::kFragmentIdentifier);
    if (identifier.empty()) {
        return Err<bool>(ErrorCode::Malformed, "Fragment without fragment.identifier");
    }
    auto count = parse_count(attrs, attr::kFragmentCount);
    if (count.is_error()) {
        return Err<bool>(count.error());
    }
    auto index = parse_count(attrs, attr::kFragmentIndex);
    if (index.is_error()) {
        return Err<bool>(index.error());
    }
    if (index.value() > count.value()) {
        return Err<bool>(ErrorCode::Malformed,
            "fragment.index " + std::to_string(index.value()) + " exceeds fragment.count " +
            std::to_string(count.value()));
    }

    std::lock_guard lock(mutex_);
    auto& parent = parents_[identifier];
    if (parent.count == 0) {
        parent.count = count.value();
    } else if (parent.count != count.value()) {
        return Err<bool>(ErrorCode::Malformed,
            "fragment.count changed for " + identifier + " from " + std::to_string(parent.count) +
            " to " + std::to_string(count.value()));
    }

    if (!parent.indices.insert(index.value()).second) {
        spdlog::debug("Fragment {}/{} of {} arrived again", index.value(), parent.count, identifier);
        return Ok(false);
    }
    if (parent.indices.size() < parent.count) {
        return Ok(false);
    }
    parents_.erase(identifier);
    return Ok(true);
}

std::size_t FragmentTracker::pending() const {
    std::lock_guard lock(mutex_);
    return parents_.size();
}

} // namespace flowfile::segment
