#pragma once

#include "flowfile/codec/scanner.hpp"
#include "flowfile/core/config.hpp"
#include "flowfile/core/file.hpp"
#include "flowfile/core/metrics.hpp"
#include "flowfile/core/result.hpp"
#include "flowfile/network/body_stream.hpp"
#include "flowfile/network/http_types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace flowfile {
namespace network {

/// What a handler knows about the request a FlowFile arrived in.
struct RequestInfo {
    std::string method;
    std::string target;
    HttpHeaders headers;
    std::string remote_host;
    std::string remote_port;
};

/// Called once per received FlowFile; an error answers the POST with 500.
using FileHandler = std::function<Result<void>(File&, const RequestInfo&)>;

/// Called once per flowfile-v3 POST with a scanner over its records.
using ScannerHandler = std::function<Result<void>(codec::Scanner&, const RequestInfo&)>;

/**
 * @brief HTTP endpoint accepting FlowFile POSTs
 *
 * HEAD advertises the protocol (Accept, x-nifi-transfer-protocol-version,
 * Max-Partition-Size, Server). POST bodies of type application/flowfile-v3
 * are scanned record by record; any other body becomes one anonymous File
 * sized by Content-Length. The body is always drained before the response,
 * which is 200 on success and 500 with the error text otherwise.
 *
 * Connections are accepted on an Asio event loop and each one is served on
 * its own thread with blocking reads, so a handler may take its time
 * reading a payload.
 */
class Receiver {
public:
    explicit Receiver(ReceiverOptions options = {});
    ~Receiver();

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    void set_file_handler(FileHandler handler);
    void set_scanner_handler(ScannerHandler handler);

    /// Records the size of every File handed to the file handler.
    void set_metrics(std::shared_ptr<TransferMetrics> metrics);

    /// Bind and start serving; port 0 picks an ephemeral port.
    Result<void> start();
    void stop();

    /// Bound port, valid after start().
    std::uint16_t port() const noexcept { return port_; }
    bool running() const noexcept { return running_; }

private:
    struct Connection {
        std::shared_ptr<SocketStream> stream;
        std::thread thread;
        bool done = false;
    };

    void do_accept();
    void serve(Connection& connection);
    HttpResponse handle(const HttpRequest& request, const std::shared_ptr<SocketStream>& stream,
                        const RequestInfo& info);
    Result<void> receive_flowfiles(const std::shared_ptr<InputStream>& body, const RequestInfo& info);
    Result<void> receive_anonymous(const std::shared_ptr<InputStream>& body, const HttpRequest& request,
                                   const RequestInfo& info);
    Result<void> dispatch(File& file, const RequestInfo& info);
    HttpResponse handshake_response() const;
    void reap_finished();

    ReceiverOptions options_;
    FileHandler file_handler_;
    ScannerHandler scanner_handler_;
    std::shared_ptr<TransferMetrics> metrics_;

    boost::asio::io_context io_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::thread accept_thread_;
    std::list<Connection> connections_;
    std::mutex connections_mutex_;
    std::uint16_t port_ = 0;
    bool running_ = false;
};

} // namespace network
} // namespace flowfile
