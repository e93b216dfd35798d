#pragma once

#include "flowfile/core/attributes.hpp"

#include <ctime>
#include <string>

namespace flowfile {

/// Where a FlowFile entered this hop.
struct HttpProvenance {
    std::string request_uri;
    std::string source_host;
    std::string source_port;
    bool tls = false;
};

/**
 * @brief Open a new link in the custody chain
 *
 * Every custodyChain.N[.field] attribute becomes custodyChain.N+1[.field],
 * then custodyChain.0.time and custodyChain.0.local.hostname are appended.
 */
void custody_chain_shift(AttributeSet& attrs, std::time_t now = std::time(nullptr));

/// Append request.uri, source.host, source.port and protocol to link 0.
void custody_chain_add_http(AttributeSet& attrs, const HttpProvenance& provenance);

} // namespace flowfile
