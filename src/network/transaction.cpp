#include "flowfile/network/transaction.hpp"
#include "flowfile/network/body_stream.hpp"

#include <spdlog/spdlog.h>

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>
#include <thread>

namespace flowfile {
namespace network {
namespace {

std::string fresh_transaction_id() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    return s.substr(first, s.find_last_not_of(" \t") - first + 1);
}

bool accepts_flowfile(const std::string& accept) {
    std::istringstream types(accept);
    std::string type;
    while (std::getline(types, type, ',')) {
        std::string t = trim(type);
        std::transform(t.begin(), t.end(), t.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (t.rfind(kFlowFileContentType, 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* transaction_state_name(TransactionState state) noexcept {
    switch (state) {
        case TransactionState::Unestablished: return "unestablished";
        case TransactionState::Ready: return "ready";
        case TransactionState::Failed: return "failed";
    }
    return "unknown";
}

Transaction::Transaction(std::string url, TransactionOptions options,
                         std::shared_ptr<checksum::ChecksumEngine> checksums)
    : options_(std::move(options))
    , checksums_(checksums ? std::move(checksums) : std::make_shared<checksum::ChecksumEngine>())
    , client_(options_.user_agent, options_.max_redirects) {
    session_.url = std::move(url);
}

Transaction::Session Transaction::snapshot() const {
    std::shared_lock lock(mutex_);
    return session_;
}

TransactionState Transaction::state() const { return snapshot().state; }
std::string Transaction::url() const { return snapshot().url; }
std::string Transaction::transaction_id() const { return snapshot().transaction_id; }
std::string Transaction::server() const { return snapshot().server; }
std::string Transaction::protocol_version() const { return snapshot().protocol_version; }
std::uint64_t Transaction::max_partition_size() const { return snapshot().max_partition_size; }

void Transaction::mark_failed() {
    std::unique_lock lock(mutex_);
    session_.state = TransactionState::Failed;
}

Result<void> Transaction::handshake() {
    const std::string target = url();
    auto parsed = Url::parse(target);
    if (parsed.is_error()) {
        return Err<void>(parsed.error());
    }

    const std::string txid = fresh_transaction_id();
    HttpHeaders headers;
    headers.set(kHeaderTransactionId, txid);
    auto probed = client_.head(parsed.value(), headers);
    if (probed.is_error()) {
        return Err<void>(probed.error());
    }

    const HttpResponse& response = probed.value().response;
    if (response.status_code != static_cast<int>(HttpStatus::OK)) {
        return Err<void>(ErrorCode::Configuration,
            "Unexpected status code " + std::to_string(response.status_code) + " from " + target);
    }
    if (!accepts_flowfile(response.get_header("Accept"))) {
        return Err<void>(ErrorCode::Configuration, "Server does not support flowfile-v3");
    }
    const std::string version = response.get_header(kHeaderProtocolVersion);
    if (version != kProtocolVersion) {
        return Err<void>(ErrorCode::Configuration, "Unknown NiFi TransferVersion \"" + version + "\"");
    }

    std::uint64_t max_partition = 0;
    std::string partition_text = response.get_header(kHeaderMaxPartitionSize);
    if (partition_text.empty()) {
        partition_text = response.get_header("x-ff-max-partition-size");
    }
    if (!partition_text.empty()) {
        auto partition = parse_length(partition_text);
        if (partition.is_error()) {
            return Err<void>(ErrorCode::Configuration, "Invalid Max-Partition-Size \"" + partition_text + "\"");
        }
        max_partition = partition.value();
    }

    Session next;
    next.state = TransactionState::Ready;
    next.url = probed.value().url.str();
    next.transaction_id = txid;
    next.server = response.get_header("Server");
    next.protocol_version = version;
    next.max_partition_size = max_partition;
    {
        std::unique_lock lock(mutex_);
        session_ = std::move(next);
    }
    spdlog::info("Handshake with {} established (transaction {}, server \"{}\")",
                 probed.value().url.str(), txid, response.get_header("Server"));
    return Ok();
}

Result<std::unique_ptr<HttpPostWriter>> Transaction::new_post_writer() {
    const Session session = snapshot();
    if (session.state != TransactionState::Ready) {
        return Err<std::unique_ptr<HttpPostWriter>>(ErrorCode::Configuration,
            std::string("Transaction is ") + transaction_state_name(session.state) + ", handshake first");
    }
    auto parsed = Url::parse(session.url);
    if (parsed.is_error()) {
        return Err<std::unique_ptr<HttpPostWriter>>(parsed.error());
    }

    HttpHeaders headers;
    headers.set("Content-Type", kFlowFileContentType);
    headers.set(kHeaderProtocolVersion, kProtocolVersion);
    headers.set(kHeaderTransactionId, session.transaction_id);
    return Ok(std::make_unique<HttpPostWriter>(client_, std::move(parsed.value()), std::move(headers), options_));
}

Result<void> Transaction::stamp_checksums(const std::vector<File*>& files) {
    if (options_.checksum_type.empty()) {
        return Ok();
    }
    for (File* f : files) {
        if (f->size() == 0 || !f->can_read_at() || f->attrs().has(attr::kChecksum)) {
            continue;
        }
        if (auto stamped = checksums_->add_checksum(*f, options_.checksum_type); stamped.is_error()) {
            return stamped;
        }
    }
    return Ok();
}

Result<void> Transaction::send_once(const std::vector<File*>& files) {
    auto writer = new_post_writer();
    if (writer.is_error()) {
        return Err<void>(writer.error());
    }
    for (File* f : files) {
        if (auto written = writer.value()->write(*f); written.is_error()) {
            return written;
        }
    }
    auto response = writer.value()->close();
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    spdlog::debug("Sent {} files ({} bytes) to {}", files.size(), writer.value()->bytes_written(),
                  writer.value()->url().str());
    return Ok();
}

Result<void> Transaction::send(const std::vector<File*>& files) {
    if (std::find(files.begin(), files.end(), nullptr) != files.end()) {
        return Err<void>(ErrorCode::InvalidArgument, "send() given a null file");
    }

    const bool retrying = options_.retries > 0;
    if (retrying) {
        for (File* f : files) {
            if (!f->can_reset()) {
                return Err<void>(ErrorCode::NotResettable,
                    "Retries need resettable files; \"" + f->attrs().get(attr::kFilename) + "\" is a stream");
            }
        }
        for (File* f : files) {
            if (auto reset = f->reset(); reset.is_error()) {
                return reset;
            }
        }
    }

    if (auto stamped = stamp_checksums(files); stamped.is_error()) {
        return stamped;
    }

    auto result = send_once(files);
    for (int attempt = 1; result.is_error() && retrying && attempt <= options_.retries; ++attempt) {
        if (!result.error().retryable()) {
            break;
        }
        spdlog::warn("Send attempt {} of {} failed: {}", attempt, options_.retries + 1,
                     result.error().describe());

        if (auto again = handshake(); again.is_error()) {
            spdlog::warn("Re-handshake failed: {}", again.error().describe());
            result = Err<void>(again.error());
            std::this_thread::sleep_for(options_.retry_delay);
            continue;
        }
        bool reset_ok = true;
        for (File* f : files) {
            if (auto reset = f->reset(); reset.is_error()) {
                result = reset;
                reset_ok = false;
                break;
            }
        }
        if (!reset_ok) {
            break;
        }
        std::this_thread::sleep_for(options_.retry_delay);
        result = send_once(files);
    }

    if (result.is_error() && result.error().retryable()) {
        mark_failed();
    }
    return result;
}

} // namespace network
} // namespace flowfile
