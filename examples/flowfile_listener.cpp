#include "flowfile/checksum/checksum.hpp"
#include "flowfile/core/config.hpp"
#include "flowfile/core/metrics.hpp"
#include "flowfile/network/receiver.hpp"
#include "flowfile/segment/fragment_tracker.hpp"
#include "flowfile/segment/save.hpp"
#include "flowfile/segment/segmenter.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using flowfile::File;
using flowfile::Result;
using flowfile::network::Receiver;
using flowfile::network::RequestInfo;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    flowfile::Config config;
    fs::path output = fs::current_path() / "received";
    int port = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = std::stoi(argv[++i]);
        } else if ((arg == "-d" || arg == "--dir") && i + 1 < argc) {
            output = fs::path(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            auto loaded = flowfile::load_config(argv[++i]);
            if (loaded.is_error()) {
                spdlog::error("{}", loaded.error().describe());
                return 1;
            }
            config = loaded.value();
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        }
    }
    if (port >= 0) {
        config.receiver.port = static_cast<std::uint16_t>(port);
    }

    auto metrics = std::make_shared<flowfile::TransferMetrics>();
    flowfile::checksum::ChecksumEngine checksums;
    flowfile::segment::FragmentTracker fragments;

    Receiver receiver(config.receiver);
    receiver.set_metrics(metrics);
    receiver.set_file_handler([&](File& file, const RequestInfo& info) -> Result<void> {
        auto saved = flowfile::segment::save(file, output, config.save);
        if (saved.is_error()) {
            return flowfile::Err<void>(saved.error());
        }
        spdlog::info("Saved {} ({} bytes) from {}", saved.value().string(), file.size(), info.remote_host);

        const auto& attrs = file.attrs();
        if (!flowfile::segment::is_fragment(attrs) || !attrs.has(flowfile::attr::kOriginalChecksum)) {
            return flowfile::Ok();
        }
        auto complete = fragments.landed(attrs);
        if (complete.is_error()) {
            return flowfile::Err<void>(complete.error());
        }
        if (!complete.value()) {
            return flowfile::Ok();
        }
        auto verified = checksums.verify_parent(saved.value(), attrs);
        if (verified.is_ok()) {
            spdlog::info("Reassembled {} verified", saved.value().string());
        }
        return verified;
    });

    fs::create_directories(output);
    if (auto started = receiver.start(); started.is_error()) {
        spdlog::error("Failed to start receiver: {}", started.error().describe());
        return 1;
    }

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int) {});
    signals_context.run();

    receiver.stop();
    spdlog::info("Transfer summary: {}", metrics->snapshot().dump());
    return 0;
}
