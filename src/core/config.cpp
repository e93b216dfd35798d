#include "flowfile/core/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace flowfile {
namespace {

using json = nlohmann::json;

std::chrono::milliseconds millis(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<std::int64_t>(fallback.count())));
}

template<typename T, typename Fn>
Result<T> section(const json& j, const char* what, Fn&& fill) {
    if (j.is_null()) {
        return Ok(T{});
    }
    if (!j.is_object()) {
        return Err<T>(ErrorCode::Configuration, std::string(what) + " must be a JSON object");
    }
    try {
        T out;
        fill(out);
        return Ok(std::move(out));
    } catch (const json::exception& e) {
        return Err<T>(ErrorCode::Configuration, std::string("Invalid ") + what + ": " + e.what());
    }
}

} // namespace

Result<TransactionOptions> transaction_options_from_json(const json& j) {
    return section<TransactionOptions>(j, "transaction options", [&](TransactionOptions& o) {
        o.retries = j.value("retries", o.retries);
        o.retry_delay = millis(j, "retry_delay_ms", o.retry_delay);
        o.checksum_type = j.value("checksum_type", o.checksum_type);
        o.flush_interval = millis(j, "flush_interval_ms", o.flush_interval);
        o.buffer_size = j.value("buffer_size", o.buffer_size);
        o.pipe_capacity = j.value("pipe_capacity", o.pipe_capacity);
        o.max_redirects = j.value("max_redirects", o.max_redirects);
        o.user_agent = j.value("user_agent", o.user_agent);
    });
}

Result<ReceiverOptions> receiver_options_from_json(const json& j) {
    return section<ReceiverOptions>(j, "receiver options", [&](ReceiverOptions& o) {
        o.address = j.value("address", o.address);
        o.port = j.value("port", o.port);
        o.server_name = j.value("server_name", o.server_name);
        o.max_partition_size = j.value("max_partition_size", o.max_partition_size);
        o.update_custody_chain = j.value("update_custody_chain", o.update_custody_chain);
    });
}

Result<SaveOptions> save_options_from_json(const json& j) {
    return section<SaveOptions>(j, "save options", [&](SaveOptions& o) {
        o.reassembly_attempts = j.value("reassembly_attempts", o.reassembly_attempts);
        o.reassembly_delay = millis(j, "reassembly_delay_ms", o.reassembly_delay);
        o.require_checksum = j.value("require_checksum", o.require_checksum);
    });
}

Result<Config> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<Config>(ErrorCode::Configuration, "Configuration root must be a JSON object");
    }

    Config config;
    auto transaction = transaction_options_from_json(j.value("transaction", json()));
    if (transaction.is_error()) {
        return Err<Config>(transaction.error());
    }
    auto receiver = receiver_options_from_json(j.value("receiver", json()));
    if (receiver.is_error()) {
        return Err<Config>(receiver.error());
    }
    auto save = save_options_from_json(j.value("save", json()));
    if (save.is_error()) {
        return Err<Config>(save.error());
    }

    config.transaction = transaction.value();
    config.receiver = receiver.value();
    config.save = save.value();
    if (config.transaction.retries < 0 || config.save.reassembly_attempts < 0) {
        return Err<Config>(ErrorCode::Configuration, "Retry counts must not be negative");
    }
    return Ok(std::move(config));
}

Result<Config> parse_config(const std::string& text) {
    const auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Err<Config>(ErrorCode::Configuration, "Configuration is not valid JSON");
    }
    return config_from_json(j);
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<Config>(ErrorCode::Configuration, "Unable to open configuration " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto config = parse_config(buffer.str());
    if (config.is_ok()) {
        spdlog::debug("Loaded configuration from {}", path.string());
    }
    return config;
}

} // namespace flowfile
