#include "flowfile/checksum/checksum.hpp"
#include "flowfile/core/config.hpp"
#include "flowfile/core/file.hpp"
#include "flowfile/network/transaction.hpp"
#include "flowfile/segment/segmenter.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using flowfile::File;
using flowfile::Result;

namespace {

void usage() {
    spdlog::info("usage: flowfile_sender [-c config.json] [-r retries] [-s segment_bytes] <url> <path>...");
}

Result<void> send_path(flowfile::network::Transaction& transaction, flowfile::checksum::ChecksumEngine& checksums,
                       const fs::path& path, std::uint64_t segment_size) {
    auto opened = File::from_path(path);
    if (opened.is_error()) {
        return flowfile::Err<void>(opened.error());
    }
    File file = std::move(opened.value());

    std::uint64_t limit = segment_size;
    if (transaction.max_partition_size() > 0 && (limit == 0 || transaction.max_partition_size() < limit)) {
        limit = transaction.max_partition_size();
    }
    if (limit == 0 || file.size() <= limit) {
        return transaction.send(file);
    }

    // Stamp the parent so every fragment carries the checksum of the whole file.
    const std::string& checksum_type = transaction.options().checksum_type;
    if (!checksum_type.empty()) {
        if (auto stamped = checksums.add_checksum(file, checksum_type); stamped.is_error()) {
            return stamped;
        }
    }
    auto fragments = flowfile::segment::segment_by_size(file, limit);
    if (fragments.is_error()) {
        return flowfile::Err<void>(fragments.error());
    }
    for (auto& fragment : fragments.value()) {
        if (auto sent = transaction.send(fragment); sent.is_error()) {
            return sent;
        }
    }
    return flowfile::Ok();
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    flowfile::Config config;
    std::uint64_t segment_size = 0;
    int retries = -1;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            auto loaded = flowfile::load_config(argv[++i]);
            if (loaded.is_error()) {
                spdlog::error("{}", loaded.error().describe());
                return 1;
            }
            config = loaded.value();
        } else if ((arg == "-r" || arg == "--retries") && i + 1 < argc) {
            retries = std::stoi(argv[++i]);
        } else if ((arg == "-s" || arg == "--segment") && i + 1 < argc) {
            segment_size = std::stoull(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() < 2) {
        usage();
        return 2;
    }
    if (retries >= 0) {
        config.transaction.retries = retries;
    }

    flowfile::checksum::ChecksumEngine checksums;
    flowfile::network::Transaction transaction(positional[0], config.transaction);
    if (auto established = transaction.handshake(); established.is_error()) {
        spdlog::error("Handshake with {} failed: {}", positional[0], established.error().describe());
        return 1;
    }

    int failures = 0;
    for (std::size_t i = 1; i < positional.size(); ++i) {
        if (auto sent = send_path(transaction, checksums, positional[i], segment_size); sent.is_error()) {
            spdlog::error("Failed to send {}: {}", positional[i], sent.error().describe());
            ++failures;
        } else {
            spdlog::info("Sent {}", positional[i]);
        }
    }
    return failures == 0 ? 0 : 1;
}
