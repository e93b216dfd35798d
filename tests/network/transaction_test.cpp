#include "flowfile/network/receiver.hpp"
#include "flowfile/network/transaction.hpp"
#include "flowfile/segment/segmenter.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace flowfile::network;
using flowfile::ErrorCode;
using flowfile::File;
using flowfile::Result;
namespace asio = boost::asio;

namespace {

// Answers every connection with the same canned response head.
class CannedServer {
public:
    explicit CannedServer(std::string response)
        : response_(std::move(response))
        , acceptor_(io_, {asio::ip::make_address("127.0.0.1"), 0}) {
        thread_ = std::thread([this]() { serve(); });
    }

    ~CannedServer() {
        stopping_ = true;
        boost::system::error_code ec;
        asio::ip::tcp::socket poke(io_);
        poke.connect(acceptor_.local_endpoint(), ec);
        thread_.join();
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/contentListener";
    }

private:
    void serve() {
        while (!stopping_) {
            asio::ip::tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) {
                return;
            }
            asio::streambuf request;
            asio::read_until(socket, request, "\r\n\r\n", ec);
            asio::write(socket, asio::buffer(response_), ec);
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        }
    }

    std::string response_;
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

std::string read_all(File& f) {
    std::string out;
    std::uint8_t buf[512];
    while (true) {
        auto got = f.read(buf, sizeof(buf));
        if (got.is_error() || got.value() == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf), got.value());
    }
    return out;
}

flowfile::ReceiverOptions local_options() {
    flowfile::ReceiverOptions options;
    options.address = "127.0.0.1";
    options.port = 0;
    options.server_name = "UnitReceiver";
    return options;
}

std::string url_of(const Receiver& receiver) {
    return "http://127.0.0.1:" + std::to_string(receiver.port()) + "/contentListener";
}

flowfile::TransactionOptions fast_options() {
    flowfile::TransactionOptions options;
    options.retry_delay = std::chrono::milliseconds(10);
    options.flush_interval = std::chrono::milliseconds(20);
    return options;
}

} // namespace

TEST(TransactionTest, HandshakeWithReceiver) {
    auto options = local_options();
    options.max_partition_size = 4096;
    Receiver receiver(options);
    receiver.set_file_handler([](File&, const RequestInfo&) { return flowfile::Ok(); });
    ASSERT_TRUE(receiver.start().is_ok());

    Transaction transaction(url_of(receiver), fast_options());
    EXPECT_EQ(transaction.state(), TransactionState::Unestablished);
    ASSERT_TRUE(transaction.handshake().is_ok());
    EXPECT_EQ(transaction.state(), TransactionState::Ready);
    EXPECT_EQ(transaction.server(), "UnitReceiver");
    EXPECT_EQ(transaction.protocol_version(), "3");
    EXPECT_EQ(transaction.max_partition_size(), 4096u);
    EXPECT_EQ(transaction.transaction_id().size(), 36u);

    const auto first_id = transaction.transaction_id();
    ASSERT_TRUE(transaction.handshake().is_ok());
    EXPECT_NE(transaction.transaction_id(), first_id);
    receiver.stop();
}

TEST(TransactionTest, HandshakeRejectsIncompatibleServers) {
    {
        CannedServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
        Transaction transaction(server.url(), fast_options());
        auto res = transaction.handshake();
        ASSERT_TRUE(res.is_error());
        EXPECT_TRUE(res.error().is(ErrorCode::Configuration));
        EXPECT_EQ(transaction.state(), TransactionState::Unestablished);
    }
    {
        CannedServer server("HTTP/1.1 200 OK\r\nAccept: text/plain\r\n"
                            "x-nifi-transfer-protocol-version: 3\r\nContent-Length: 0\r\n\r\n");
        Transaction transaction(server.url(), fast_options());
        auto res = transaction.handshake();
        ASSERT_TRUE(res.is_error());
        EXPECT_TRUE(res.error().is(ErrorCode::Configuration));
    }
    {
        CannedServer server("HTTP/1.1 200 OK\r\nAccept: application/flowfile-v3\r\n"
                            "x-nifi-transfer-protocol-version: 2\r\nContent-Length: 0\r\n\r\n");
        Transaction transaction(server.url(), fast_options());
        auto res = transaction.handshake();
        ASSERT_TRUE(res.is_error());
        EXPECT_TRUE(res.error().is(ErrorCode::Configuration));
    }
}

TEST(TransactionTest, HandshakeReadsLegacyPartitionHeader) {
    CannedServer server("HTTP/1.1 200 OK\r\nAccept: application/flowfile-v3,*/*;q=0.8\r\n"
                        "x-nifi-transfer-protocol-version: 3\r\nx-ff-max-partition-size: 777\r\n"
                        "Content-Length: 0\r\n\r\n");
    Transaction transaction(server.url(), fast_options());
    ASSERT_TRUE(transaction.handshake().is_ok());
    EXPECT_EQ(transaction.max_partition_size(), 777u);
}

TEST(TransactionTest, HandshakeFailsForUnreachableOrInvalidUrl) {
    Transaction unreachable("http://127.0.0.1:1/contentListener", fast_options());
    auto res = unreachable.handshake();
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::Transport));

    Transaction invalid("ftp://example.com/", fast_options());
    res = invalid.handshake();
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::Configuration));
}

TEST(TransactionTest, SendRequiresHandshake) {
    Transaction transaction("http://127.0.0.1:1/", fast_options());
    File f = File::from_string("data");
    auto res = transaction.send(f);
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::Configuration));
}

TEST(TransactionTest, SendsFilesWithChecksums) {
    Receiver receiver(local_options());
    std::mutex mutex;
    std::vector<std::string> contents;
    std::vector<bool> verified;
    std::vector<std::string> transaction_ids;
    receiver.set_file_handler([&](File& f, const RequestInfo& info) -> Result<void> {
        const std::string content = read_all(f);
        const bool ok = f.verify().is_ok();
        std::lock_guard lock(mutex);
        contents.push_back(content);
        verified.push_back(ok);
        transaction_ids.push_back(info.headers.get("x-nifi-transaction-id"));
        return flowfile::Ok();
    });
    ASSERT_TRUE(receiver.start().is_ok());

    Transaction transaction(url_of(receiver), fast_options());
    ASSERT_TRUE(transaction.handshake().is_ok());

    File a = File::from_string(std::string(100000, 'a'));
    a.attrs().set("filename", "a.bin");
    File b = File::from_string("bee");
    b.attrs().set("filename", "b.txt");
    auto sent = transaction.send({&a, &b});
    ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    receiver.stop();

    EXPECT_EQ(a.attrs().get("checksumType"), "SHA256");
    ASSERT_EQ(contents.size(), 2u);
    EXPECT_EQ(contents[0], std::string(100000, 'a'));
    EXPECT_EQ(contents[1], "bee");
    EXPECT_EQ(verified, (std::vector<bool>{true, true}));
    EXPECT_EQ(transaction_ids[0], transaction.transaction_id());
}

TEST(TransactionTest, SendsFragmentsUnstampedWhenChecksumsDisabled) {
    Receiver receiver(local_options());
    std::mutex mutex;
    std::vector<std::string> contents;
    std::vector<bool> stamped;
    receiver.set_file_handler([&](File& f, const RequestInfo&) -> Result<void> {
        const std::string content = read_all(f);
        std::lock_guard lock(mutex);
        contents.push_back(content);
        stamped.push_back(f.attrs().has("checksum") || f.attrs().has("segment.original.checksum"));
        return flowfile::Ok();
    });
    ASSERT_TRUE(receiver.start().is_ok());

    auto options = fast_options();
    options.checksum_type.clear();
    Transaction transaction(url_of(receiver), options);
    ASSERT_TRUE(transaction.handshake().is_ok());

    File parent = File::from_string("0123456789");
    parent.attrs().set("filename", "digits.txt");
    auto fragments = flowfile::segment::segment_by_size(parent, 4);
    ASSERT_TRUE(fragments.is_ok());
    for (auto& fragment : fragments.value()) {
        auto sent = transaction.send(fragment);
        ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    }
    receiver.stop();

    EXPECT_EQ(contents, (std::vector<std::string>{"0123", "4567", "89"}));
    EXPECT_EQ(stamped, (std::vector<bool>{false, false, false}));
}

TEST(TransactionTest, RetriesWithFreshHandshake) {
    Receiver receiver(local_options());
    std::atomic<int> calls{0};
    std::mutex mutex;
    std::vector<std::string> ids;
    receiver.set_file_handler([&](File& f, const RequestInfo& info) -> Result<void> {
        read_all(f);
        {
            std::lock_guard lock(mutex);
            ids.push_back(info.headers.get("x-nifi-transaction-id"));
        }
        if (calls.fetch_add(1) == 0) {
            return flowfile::Err<void>(ErrorCode::Io, "transient failure");
        }
        return flowfile::Ok();
    });
    ASSERT_TRUE(receiver.start().is_ok());

    auto options = fast_options();
    options.retries = 2;
    Transaction transaction(url_of(receiver), options);
    ASSERT_TRUE(transaction.handshake().is_ok());

    File f = File::from_string("retry me");
    f.attrs().set("filename", "retry.txt");
    auto sent = transaction.send(f);
    receiver.stop();

    ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    EXPECT_EQ(calls.load(), 2);
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_NE(ids[0], ids[1]);
    EXPECT_EQ(transaction.state(), TransactionState::Ready);
}

TEST(TransactionTest, ExhaustedRetriesMarkFailed) {
    Receiver receiver(local_options());
    std::atomic<int> calls{0};
    receiver.set_file_handler([&](File& f, const RequestInfo&) -> Result<void> {
        read_all(f);
        ++calls;
        return flowfile::Err<void>(ErrorCode::Io, "always failing");
    });
    ASSERT_TRUE(receiver.start().is_ok());

    auto options = fast_options();
    options.retries = 1;
    Transaction transaction(url_of(receiver), options);
    ASSERT_TRUE(transaction.handshake().is_ok());

    File f = File::from_string("doomed");
    auto sent = transaction.send(f);
    receiver.stop();

    ASSERT_TRUE(sent.is_error());
    EXPECT_TRUE(sent.error().is(ErrorCode::HttpStatus));
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(transaction.state(), TransactionState::Failed);
}

TEST(TransactionTest, RetriesRejectStreamsBeforeSending) {
    auto options = fast_options();
    options.retries = 3;
    Transaction transaction("http://127.0.0.1:1/contentListener", options);

    auto stream = std::make_shared<flowfile::SequentialOnly>(
        std::make_shared<flowfile::MemoryStream>(std::string("streamed")));
    File f(stream, 8);
    auto res = transaction.send(f);
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::NotResettable));
    EXPECT_EQ(f.remaining(), 8u);
}

TEST(TransactionTest, TerminatedWriterDeliversNothing) {
    Receiver receiver(local_options());
    std::atomic<int> calls{0};
    receiver.set_file_handler([&](File& f, const RequestInfo&) -> Result<void> {
        read_all(f);
        ++calls;
        return flowfile::Ok();
    });
    ASSERT_TRUE(receiver.start().is_ok());

    auto options = fast_options();
    options.flush_interval = std::chrono::milliseconds(1000);
    Transaction transaction(url_of(receiver), options);
    ASSERT_TRUE(transaction.handshake().is_ok());

    auto writer = transaction.new_post_writer();
    ASSERT_TRUE(writer.is_ok());
    File f = File::from_string("never delivered");
    ASSERT_TRUE(writer.value()->write(f).is_ok());
    writer.value()->terminate();

    auto closed = writer.value()->close();
    ASSERT_TRUE(closed.is_error());
    EXPECT_TRUE(closed.error().is(ErrorCode::Closed));
    receiver.stop();
    EXPECT_EQ(calls.load(), 0);
}

TEST(TransactionTest, PostWriterHeadersAreFixedOnceStarted) {
    Receiver receiver(local_options());
    std::string seen;
    receiver.set_file_handler([&](File& f, const RequestInfo& info) -> Result<void> {
        read_all(f);
        seen = info.headers.get("X-Batch");
        return flowfile::Ok();
    });
    ASSERT_TRUE(receiver.start().is_ok());

    Transaction transaction(url_of(receiver), fast_options());
    ASSERT_TRUE(transaction.handshake().is_ok());
    auto writer = transaction.new_post_writer();
    ASSERT_TRUE(writer.is_ok());
    ASSERT_TRUE(writer.value()->set_header("X-Batch", "42").is_ok());

    File f = File::from_string("payload");
    ASSERT_TRUE(writer.value()->write(f).is_ok());
    EXPECT_TRUE(writer.value()->set_header("X-Late", "1").is_error());

    auto response = writer.value()->close();
    ASSERT_TRUE(response.is_ok()) << response.error().describe();
    EXPECT_EQ(response.value().status_code, 200);
    EXPECT_GT(writer.value()->bytes_written(), 7u);
    receiver.stop();
    EXPECT_EQ(seen, "42");
}
