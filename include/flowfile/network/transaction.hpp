#pragma once

#include "flowfile/checksum/checksum.hpp"
#include "flowfile/core/config.hpp"
#include "flowfile/core/file.hpp"
#include "flowfile/core/result.hpp"
#include "flowfile/network/http_client.hpp"
#include "flowfile/network/post_writer.hpp"

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace flowfile {
namespace network {

enum class TransactionState {
    Unestablished,
    Ready,
    Failed
};

const char* transaction_state_name(TransactionState state) noexcept;

/**
 * @brief Negotiated HTTP session with one FlowFile receiver
 *
 * handshake() probes the endpoint with HEAD and replaces the session fields
 * (url after redirects, transaction id, server, max partition size) as a
 * whole. Writers read them under the shared side of the same lock, so a
 * concurrent handshake never exposes a half-updated url/id pair.
 */
class Transaction {
public:
    Transaction(std::string url, TransactionOptions options = {},
                std::shared_ptr<checksum::ChecksumEngine> checksums = nullptr);

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @brief Probe the endpoint and (re)establish the session
     *
     * Configuration errors for an incompatible peer (status, Accept,
     * protocol version, bad URL); Transport errors when it cannot be reached.
     */
    Result<void> handshake();

    /// A POST writer bound to the current session.
    Result<std::unique_ptr<HttpPostWriter>> new_post_writer();

    /**
     * @brief Send @p files in one POST, with retries when configured
     *
     * Random-access files without a checksum get one stamped first. With
     * retries enabled every file must be resettable (NotResettable
     * otherwise, before any network traffic); each failed attempt is followed
     * by a new handshake, a reset of every file and the retry delay.
     */
    Result<void> send(const std::vector<File*>& files);
    Result<void> send(File& file) { return send(std::vector<File*>{&file}); }

    TransactionState state() const;
    std::string url() const;
    std::string transaction_id() const;
    std::string server() const;
    std::string protocol_version() const;
    /// 0 means unbounded.
    std::uint64_t max_partition_size() const;

    const TransactionOptions& options() const noexcept { return options_; }

private:
    struct Session {
        TransactionState state = TransactionState::Unestablished;
        std::string url;
        std::string transaction_id;
        std::string server;
        std::string protocol_version;
        std::uint64_t max_partition_size = 0;
    };

    Session snapshot() const;
    Result<void> send_once(const std::vector<File*>& files);
    Result<void> stamp_checksums(const std::vector<File*>& files);
    void mark_failed();

    TransactionOptions options_;
    std::shared_ptr<checksum::ChecksumEngine> checksums_;
    HttpClient client_;
    Session session_;
    mutable std::shared_mutex mutex_;
};

} // namespace network
} // namespace flowfile
