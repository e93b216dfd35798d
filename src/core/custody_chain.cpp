#include "flowfile/core/custody_chain.hpp"
#include "flowfile/core/time_util.hpp"

#include <boost/asio/ip/host_name.hpp>

#include <charconv>

namespace flowfile {
namespace {

constexpr const char kPrefix[] = "custodyChain.";
constexpr std::size_t kPrefixSize = sizeof(kPrefix) - 1;

// custodyChain.<n>[.<rest>] -> custodyChain.<n+1>[.<rest>]; false for other names.
bool shifted_name(const std::string& name, std::string& out) {
    if (name.compare(0, kPrefixSize, kPrefix) != 0) {
        return false;
    }
    const char* first = name.data() + kPrefixSize;
    const char* last = name.data() + name.size();
    unsigned long index = 0;
    const auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc() || ptr == first || (ptr != last && *ptr != '.')) {
        return false;
    }
    out = kPrefix + std::to_string(index + 1) + std::string(ptr, last);
    return true;
}

} // namespace

void custody_chain_shift(AttributeSet& attrs, std::time_t now) {
    AttributeSet updated;
    std::string renamed;
    for (const auto& a : attrs) {
        if (a.name.compare(0, kPrefixSize, kPrefix) == 0) {
            // Chain entries without a numeric index are dropped.
            if (shifted_name(a.name, renamed)) {
                updated.set(renamed, a.value);
            }
            continue;
        }
        updated.set(a.name, a.value);
    }

    updated.set("custodyChain.0.time", format_rfc3339(now));
    boost::system::error_code ec;
    const std::string hostname = boost::asio::ip::host_name(ec);
    if (!ec) {
        updated.set("custodyChain.0.local.hostname", hostname);
    }
    attrs = std::move(updated);
}

void custody_chain_add_http(AttributeSet& attrs, const HttpProvenance& provenance) {
    if (!provenance.request_uri.empty()) {
        attrs.set("custodyChain.0.request.uri", provenance.request_uri);
    }
    if (!provenance.source_host.empty()) {
        attrs.set("custodyChain.0.source.host", provenance.source_host);
        attrs.set("custodyChain.0.source.port", provenance.source_port);
    }
    attrs.set("custodyChain.0.protocol", provenance.tls ? "HTTPS" : "HTTP");
}

} // namespace flowfile
