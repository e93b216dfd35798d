#include "flowfile/network/receiver.hpp"
#include "flowfile/core/custody_chain.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace flowfile {
namespace network {
namespace asio = boost::asio;
namespace {

std::string media_type(const std::string& content_type) {
    std::string type = content_type.substr(0, content_type.find(';'));
    type.erase(std::remove_if(type.begin(), type.end(), [](unsigned char c) { return std::isspace(c); }),
               type.end());
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return type;
}

} // namespace

Receiver::Receiver(ReceiverOptions options)
    : options_(std::move(options)) {
}

Receiver::~Receiver() {
    stop();
}

void Receiver::set_file_handler(FileHandler handler) {
    file_handler_ = std::move(handler);
}

void Receiver::set_scanner_handler(ScannerHandler handler) {
    scanner_handler_ = std::move(handler);
}

void Receiver::set_metrics(std::shared_ptr<TransferMetrics> metrics) {
    metrics_ = std::move(metrics);
}

Result<void> Receiver::start() {
    if (running_) {
        return Err<void>(ErrorCode::InvalidArgument, "Receiver already running");
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(options_.address, ec);
    if (ec) {
        return Err<void>(ErrorCode::Configuration, "Invalid listen address \"" + options_.address + "\"");
    }
    const tcp::endpoint endpoint(address, options_.port);

    io_context_.restart();
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        acceptor_.reset();
        return Err<void>(ErrorCode::Io, "Unable to listen on " + options_.address + ":" +
                         std::to_string(options_.port) + ": " + ec.message());
    }
    port_ = acceptor_->local_endpoint().port();

    running_ = true;
    do_accept();
    accept_thread_ = std::thread([this]() { io_context_.run(); });
    spdlog::info("FlowFile receiver listening on {}:{}", options_.address, port_);
    return Ok();
}

void Receiver::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    io_context_.stop();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();

    std::list<Connection> active;
    {
        std::lock_guard lock(connections_mutex_);
        active.splice(active.end(), connections_);
        for (auto& connection : active) {
            connection.stream->shutdown();
        }
    }
    for (auto& connection : active) {
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
    }
    spdlog::info("FlowFile receiver on port {} stopped", port_);
}

void Receiver::do_accept() {
    acceptor_->async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::error("Accept error: {}", ec.message());
                }
                if (!running_ || !acceptor_->is_open()) {
                    return;
                }
            } else {
                std::lock_guard lock(connections_mutex_);
                reap_finished();
                connections_.emplace_back();
                Connection& connection = connections_.back();
                connection.stream = std::make_shared<SocketStream>(std::move(socket));
                connection.thread = std::thread([this, &connection]() { serve(connection); });
            }
            do_accept();
        });
}

void Receiver::reap_finished() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->done) {
            it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void Receiver::serve(Connection& connection) {
    const auto& stream = connection.stream;
    if (metrics_) {
        metrics_->connection_opened();
    }

    RequestInfo info;
    boost::system::error_code ec;
    const auto remote = stream->socket().remote_endpoint(ec);
    if (!ec) {
        info.remote_host = remote.address().to_string();
        info.remote_port = std::to_string(remote.port());
    }

    auto head = read_request_head(*stream);
    if (head.is_ok()) {
        const HttpRequest& request = head.value();
        info.method = request.method_name;
        info.target = request.url;
        info.headers = request.headers;
        spdlog::debug("{} {} from {}:{}", request.method_name, request.url, info.remote_host, info.remote_port);

        HttpResponse response = handle(request, stream, info);
        if (!options_.server_name.empty()) {
            response.set_header("Server", options_.server_name);
        }
        response.set_header("Connection", "close");
        if (!response.headers.has("Content-Length")) {
            response.set_header("Content-Length", std::to_string(response.body.size()));
        }
        const auto bytes = response.serialize();
        if (auto sent = stream->write(bytes.data(), bytes.size()); sent.is_error()) {
            spdlog::debug("Unable to send response to {}: {}", info.remote_host, sent.error().message);
        }
    } else if (head.error().is(ErrorCode::Malformed)) {
        spdlog::warn("Bad request from {}: {}", info.remote_host, head.error().message);
        HttpResponse response(HttpStatus::BAD_REQUEST);
        response.set_header("Content-Type", "text/plain");
        response.set_header("Connection", "close");
        response.set_body(head.error().message);
        const auto bytes = response.serialize();
        if (auto sent = stream->write(bytes.data(), bytes.size()); sent.is_error()) {
            spdlog::debug("Unable to send response to {}: {}", info.remote_host, sent.error().message);
        }
    }

    stream->shutdown();
    if (metrics_) {
        metrics_->connection_closed();
    }
    std::lock_guard lock(connections_mutex_);
    connection.done = true;
}

HttpResponse Receiver::handshake_response() const {
    HttpResponse response(HttpStatus::OK);
    response.set_header("Accept", std::string(kFlowFileContentType) + ",*/*;q=0.8");
    response.set_header(kHeaderProtocolVersion, kProtocolVersion);
    if (options_.max_partition_size > 0) {
        response.set_header(kHeaderMaxPartitionSize, std::to_string(options_.max_partition_size));
    }
    response.set_header("Content-Length", "0");
    return response;
}

HttpResponse Receiver::handle(const HttpRequest& request, const std::shared_ptr<SocketStream>& stream,
                              const RequestInfo& info) {
    if (!file_handler_ && !scanner_handler_) {
        return HttpResponse(HttpStatus::NOT_IMPLEMENTED);
    }
    if (request.method == HttpMethod::HEAD) {
        return handshake_response();
    }
    if (request.method != HttpMethod::POST) {
        HttpResponse response(HttpStatus::METHOD_NOT_ALLOWED);
        response.set_header("Allow", "HEAD, POST");
        return response;
    }

    const bool flowfile = media_type(request.get_header("Content-Type")) == kFlowFileContentType;
    if (!flowfile && !request.has_header("Content-Length")) {
        HttpResponse response(HttpStatus::LENGTH_REQUIRED);
        response.set_header("Content-Type", "text/plain");
        response.set_body("Content-Length required for non-FlowFile content");
        return response;
    }

    auto body = open_body(stream, request.headers, false);
    if (body.is_error()) {
        HttpResponse response(HttpStatus::BAD_REQUEST);
        response.set_header("Content-Type", "text/plain");
        response.set_body(body.error().message);
        return response;
    }

    Result<void> received = Ok();
    if (flowfile) {
        received = receive_flowfiles(body.value(), info);
    } else {
        received = receive_anonymous(body.value(), request, info);
    }

    // Whatever the handler left unread is discarded so the peer sees a complete exchange.
    DiscardSink discard;
    if (auto drained = copy_stream(*body.value(), discard); drained.is_error()) {
        spdlog::debug("Draining request body from {} failed: {}", info.remote_host, drained.error().message);
    }

    if (received.is_ok()) {
        HttpResponse response(HttpStatus::OK);
        response.set_header("Content-Type", "text/plain");
        response.set_header("Content-Length", "0");
        return response;
    }
    spdlog::error("Error receiving from {}: {}", info.remote_host, received.error().describe());
    HttpResponse response(HttpStatus::INTERNAL_SERVER_ERROR);
    response.set_header("Content-Type", "text/plain");
    response.set_body("Error " + received.error().message);
    return response;
}

Result<void> Receiver::dispatch(File& file, const RequestInfo& info) {
    if (options_.update_custody_chain) {
        custody_chain_shift(file.attrs());
        custody_chain_add_http(file.attrs(), HttpProvenance{info.target, info.remote_host, info.remote_port, false});
    }
    if (metrics_) {
        metrics_->record(file.size());
    }
    try {
        return file_handler_(file, info);
    } catch (const std::exception& e) {
        spdlog::error("File handler threw: {}", e.what());
        return Err<void>(ErrorCode::Io, std::string("handler failed: ") + e.what());
    }
}

Result<void> Receiver::receive_flowfiles(const std::shared_ptr<InputStream>& body, const RequestInfo& info) {
    codec::Scanner scanner(body);

    if (scanner_handler_) {
        Result<void> handled = Ok();
        try {
            handled = scanner_handler_(scanner, info);
        } catch (const std::exception& e) {
            spdlog::error("Scanner handler threw: {}", e.what());
            handled = Err<void>(ErrorCode::Io, std::string("handler failed: ") + e.what());
        }
        if (handled.is_error()) {
            return handled;
        }
    } else {
        while (scanner.scan()) {
            if (auto handled = dispatch(scanner.file(), info); handled.is_error()) {
                return handled;
            }
        }
    }

    if (scanner.error()) {
        return Err<void>(*scanner.error());
    }
    spdlog::debug("Received {} FlowFiles from {}", scanner.records(), info.remote_host);
    return Ok();
}

Result<void> Receiver::receive_anonymous(const std::shared_ptr<InputStream>& body, const HttpRequest& request,
                                         const RequestInfo& info) {
    if (!file_handler_) {
        return Err<void>(ErrorCode::InvalidArgument, "No handler for non-FlowFile content");
    }
    auto length = parse_length(request.get_header("Content-Length"));
    if (length.is_error()) {
        return Err<void>(length.error());
    }

    File file(body, length.value());
    auto handled = dispatch(file, info);
    if (auto closed = file.close(); closed.is_error() && handled.is_ok()) {
        return closed;
    }
    return handled;
}

} // namespace network
} // namespace flowfile
