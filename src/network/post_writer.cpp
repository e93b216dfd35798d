#include "flowfile/network/post_writer.hpp"
#include "flowfile/codec/wire_codec.hpp"

#include <spdlog/spdlog.h>

namespace flowfile {
namespace network {

class HttpPostWriter::CountingSink : public OutputSink {
public:
    CountingSink(OutputSink& inner, std::atomic<std::uint64_t>& counter)
        : inner_(inner), counter_(counter) {}

    Result<void> write(const std::uint8_t* data, std::size_t len) override {
        auto written = inner_.write(data, len);
        if (written.is_ok()) {
            counter_ += len;
        }
        return written;
    }

private:
    OutputSink& inner_;
    std::atomic<std::uint64_t>& counter_;
};

HttpPostWriter::HttpPostWriter(HttpClient client, Url url, HttpHeaders headers, const TransactionOptions& options)
    : client_(std::move(client))
    , url_(std::move(url))
    , headers_(std::move(headers))
    , pipe_(std::make_unique<BytePipe>(options.pipe_capacity)) {
    buffered_ = std::make_unique<LatencyWriter>(*pipe_, options.buffer_size, options.flush_interval);
    counter_ = std::make_unique<CountingSink>(*buffered_, bytes_written_);
}

HttpPostWriter::~HttpPostWriter() {
    std::lock_guard lock(mutex_);
    if (started_ && !finished_) {
        terminate_locked(Error(ErrorCode::Terminated, "POST writer destroyed before close"));
    }
    buffered_->abandon();
}

Result<void> HttpPostWriter::set_header(const std::string& name, const std::string& value) {
    std::lock_guard lock(mutex_);
    if (started_ || finished_) {
        return Err<void>(ErrorCode::InvalidArgument, "Headers can only be set before the first write");
    }
    headers_.set(name, value);
    return Ok();
}

void HttpPostWriter::start_locked() {
    started_ = true;
    std::promise<Result<HttpResponse>> promise;
    response_ = promise.get_future();
    http_thread_ = std::thread([this, promise = std::move(promise)]() mutable {
        auto response = client_.post_chunked(url_, headers_, *pipe_);
        if (response.is_error()) {
            // Unblock a writer waiting on a full pipe.
            pipe_->fail_reader(response.error());
        } else {
            pipe_->fail_reader(Error(ErrorCode::Closed, "request already completed"));
        }
        promise.set_value(std::move(response));
    });
    spdlog::debug("Started POST to {}", url_.str());
}

Result<void> HttpPostWriter::write(File& file) {
    std::lock_guard lock(mutex_);
    if (finished_) {
        return Err<void>(ErrorCode::Closed, "write after close or terminate");
    }
    if (!started_) {
        start_locked();
    }

    auto encoded = codec::encode(file, *counter_);
    if (encoded.is_error()) {
        spdlog::warn("Aborting POST to {}: {}", url_.str(), encoded.error().message);
        terminate_locked(encoded.error());
        return encoded;
    }
    return Ok();
}

Result<HttpResponse> HttpPostWriter::close() {
    std::lock_guard lock(mutex_);
    if (finished_) {
        return Err<HttpResponse>(ErrorCode::Closed, "POST writer already finished");
    }
    if (!started_) {
        start_locked();
    }
    finished_ = true;

    auto flushed = buffered_->close();
    if (flushed.is_error()) {
        pipe_->close_with_error(flushed.error());
    } else {
        pipe_->close();
    }
    http_thread_.join();

    auto response = response_.get();
    if (response.is_error()) {
        return response;
    }
    if (flushed.is_error()) {
        return Err<HttpResponse>(flushed.error());
    }
    if (response.value().status_code != static_cast<int>(HttpStatus::OK)) {
        return Err<HttpResponse>(ErrorCode::HttpStatus,
            "File did not send successfully: " + std::to_string(response.value().status_code) + " " +
            response.value().body_as_string());
    }
    return response;
}

void HttpPostWriter::terminate() {
    std::lock_guard lock(mutex_);
    if (!finished_) {
        terminate_locked(Error(ErrorCode::Terminated, "POST terminated by caller"));
    }
}

void HttpPostWriter::terminate_locked(const Error& reason) {
    finished_ = true;
    pipe_->close_with_error(reason);
    buffered_->abandon();
    if (http_thread_.joinable()) {
        http_thread_.join();
    }
}

} // namespace network
} // namespace flowfile
