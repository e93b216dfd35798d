#pragma once

#include "flowfile/core/config.hpp"
#include "flowfile/core/file.hpp"
#include "flowfile/core/result.hpp"
#include "flowfile/network/http_client.hpp"
#include "flowfile/network/latency_writer.hpp"
#include "flowfile/network/pipe.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace flowfile {
namespace network {

/**
 * @brief One streaming FlowFile POST
 *
 * Each write() frames one File onto the request body. The request itself
 * runs on a dedicated thread, started by the first write(), which reads the
 * body from a bounded pipe, so write() blocks when the peer is slower than
 * the caller. Body bytes pass through a LatencyWriter so they leave in
 * reasonably sized pieces without waiting longer than the flush interval.
 *
 * close() ends the body and waits for the response; anything but 200 is an
 * HttpStatus error. terminate() aborts the request so the peer sees a
 * truncated body instead of a complete, valid one.
 *
 * A single mutex serializes write(), close() and terminate().
 */
class HttpPostWriter {
public:
    HttpPostWriter(HttpClient client, Url url, HttpHeaders headers, const TransactionOptions& options);
    ~HttpPostWriter();

    HttpPostWriter(const HttpPostWriter&) = delete;
    HttpPostWriter& operator=(const HttpPostWriter&) = delete;

    /// Add a request header; only possible before the first write().
    Result<void> set_header(const std::string& name, const std::string& value);

    Result<void> write(File& file);
    Result<HttpResponse> close();
    void terminate();

    /// Framed bytes accepted so far.
    std::uint64_t bytes_written() const noexcept { return bytes_written_.load(); }

    const Url& url() const noexcept { return url_; }

private:
    class CountingSink;

    void start_locked();
    void terminate_locked(const Error& reason);

    HttpClient client_;
    Url url_;
    HttpHeaders headers_;
    std::unique_ptr<BytePipe> pipe_;
    std::unique_ptr<CountingSink> counter_;
    std::unique_ptr<LatencyWriter> buffered_;
    std::thread http_thread_;
    std::future<Result<HttpResponse>> response_;
    std::atomic<std::uint64_t> bytes_written_{0};
    bool started_ = false;
    bool finished_ = false;
    std::mutex mutex_;
};

} // namespace network
} // namespace flowfile
