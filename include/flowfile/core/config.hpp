#pragma once

#include "flowfile/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace flowfile {

/// Client side of a Transaction and its POST writers.
struct TransactionOptions {
    int retries = 0;
    std::chrono::milliseconds retry_delay{5000};
    /// Algorithm stamped onto unchecksummed random-access files; empty disables it.
    std::string checksum_type = "SHA256";
    /// Upper bound on how long buffered body bytes wait before being flushed.
    std::chrono::milliseconds flush_interval{400};
    std::size_t buffer_size = 64 * 1024;
    /// Chunks held in the writer/HTTP-thread pipe before write() blocks.
    std::size_t pipe_capacity = 16;
    int max_redirects = 5;
    std::string user_agent = "flowfile-cpp/1.0";
};

struct ReceiverOptions {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    /// Value of the Server header; omitted when empty.
    std::string server_name;
    /// Advertised as Max-Partition-Size when non-zero.
    std::uint64_t max_partition_size = 0;
    bool update_custody_chain = false;
};

struct SaveOptions {
    /// How many times a fragment writer re-checks a target that is not yet full size.
    int reassembly_attempts = 10;
    std::chrono::milliseconds reassembly_delay{3000};
    /// When false, a whole file that arrives without a checksum is kept.
    bool require_checksum = true;
};

struct Config {
    TransactionOptions transaction;
    ReceiverOptions receiver;
    SaveOptions save;
};

// Every key is optional; missing keys keep their defaults. Durations are
// given in milliseconds ("retry_delay_ms", "flush_interval_ms", ...).
Result<TransactionOptions> transaction_options_from_json(const nlohmann::json& j);
Result<ReceiverOptions> receiver_options_from_json(const nlohmann::json& j);
Result<SaveOptions> save_options_from_json(const nlohmann::json& j);

/// {"transaction": {...}, "receiver": {...}, "save": {...}}
Result<Config> config_from_json(const nlohmann::json& j);
Result<Config> parse_config(const std::string& text);
Result<Config> load_config(const std::filesystem::path& path);

} // namespace flowfile
