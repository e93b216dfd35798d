#include "flowfile/core/file.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using flowfile::ChecksumState;
using flowfile::ErrorCode;
using flowfile::File;
using flowfile::MemoryStream;
using flowfile::SequentialOnly;

namespace {

constexpr const char kAbcSha256[] = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() / fs::path("flowfile_file_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_all(File& f) {
    std::string out;
    std::uint8_t buf[3];
    while (true) {
        auto got = f.read(buf, sizeof(buf));
        EXPECT_TRUE(got.is_ok());
        if (got.is_error() || got.value() == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf), got.value());
    }
    return out;
}

File sequential(const std::string& data, std::uint64_t size) {
    auto stream = std::make_shared<SequentialOnly>(std::make_shared<MemoryStream>(data));
    return File(stream, size);
}

} // namespace

TEST(FileTest, ReadsDeclaredSizeOnly) {
    auto stream = std::make_shared<MemoryStream>(std::string("hello world"));
    File f(stream, 5);
    EXPECT_EQ(read_all(f), "hello");
    EXPECT_EQ(f.remaining(), 0u);
    EXPECT_EQ(f.position(), 5u);
}

TEST(FileTest, ShortSourceIsMalformed) {
    File f = sequential("abc", 10);
    std::uint8_t buf[16];
    auto first = f.read(buf, sizeof(buf));
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), 3u);

    auto second = f.read(buf, sizeof(buf));
    ASSERT_TRUE(second.is_error());
    EXPECT_TRUE(second.error().is(ErrorCode::Malformed));
}

TEST(FileTest, RandomAccessWindowResets) {
    auto source = std::make_shared<MemoryStream>(std::string("0123456789"));
    File f(source, 3, 4);
    EXPECT_TRUE(f.can_reset());
    EXPECT_EQ(read_all(f), "3456");

    ASSERT_TRUE(f.reset().is_ok());
    EXPECT_EQ(f.remaining(), 4u);
    EXPECT_EQ(read_all(f), "3456");
}

TEST(FileTest, ReadAtDoesNotMoveCursor) {
    File f = File::from_string("abcdef");
    std::uint8_t buf[2];
    auto got = f.read_at(buf, sizeof(buf), 4);
    ASSERT_TRUE(got.is_ok());
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buf), got.value()), "ef");
    EXPECT_EQ(f.remaining(), 6u);

    auto past_end = f.read_at(buf, sizeof(buf), 6);
    ASSERT_TRUE(past_end.is_ok());
    EXPECT_EQ(past_end.value(), 0u);
}

TEST(FileTest, SequentialCannotResetOrReadAt) {
    File f = sequential("abc", 3);
    EXPECT_FALSE(f.can_reset());

    auto reset = f.reset();
    ASSERT_TRUE(reset.is_error());
    EXPECT_TRUE(reset.error().is(ErrorCode::NotResettable));

    std::uint8_t buf[1];
    auto at = f.read_at(buf, 1, 0);
    ASSERT_TRUE(at.is_error());
    EXPECT_TRUE(at.error().is(ErrorCode::NotSeekable));
}

TEST(FileTest, EmptySequentialCanReset) {
    File f = sequential("", 0);
    EXPECT_TRUE(f.can_reset());
    EXPECT_TRUE(f.reset().is_ok());
}

TEST(FileTest, CloseDrainsSharedStreamAndIsIdempotent) {
    auto shared = std::make_shared<SequentialOnly>(std::make_shared<MemoryStream>(std::string("aaaabbb")));
    File first(shared, 4);
    std::uint8_t buf[1];
    ASSERT_TRUE(first.read(buf, 1).is_ok());

    ASSERT_TRUE(first.close().is_ok());
    EXPECT_TRUE(first.closed());
    EXPECT_TRUE(first.close().is_ok());

    File second(shared, 3);
    EXPECT_EQ(read_all(second), "bbb");
}

TEST(FileTest, ReadAfterCloseFails) {
    File f = File::from_string("abc");
    ASSERT_TRUE(f.close().is_ok());
    std::uint8_t buf[4];
    auto got = f.read(buf, sizeof(buf));
    ASSERT_TRUE(got.is_error());
    EXPECT_TRUE(got.error().is(ErrorCode::Closed));
}

TEST(FileTest, MovedFromFileIsEmpty) {
    File original = File::from_string("payload");
    File moved = std::move(original);
    EXPECT_EQ(moved.size(), 7u);
    EXPECT_EQ(original.size(), 0u);
    EXPECT_TRUE(original.closed());
}

TEST(FileTest, VerifyPassesForMatchingChecksum) {
    File f = File::from_string("abc");
    f.attrs().set("checksumType", "sha256");
    f.attrs().set("checksum", std::string(kAbcSha256));
    EXPECT_EQ(read_all(f), "abc");

    ASSERT_TRUE(f.verify().is_ok());
    EXPECT_EQ(f.checksum_state(), ChecksumState::Passed);
}

TEST(FileTest, VerifyAcceptsUppercaseHex) {
    std::string upper(kAbcSha256);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    File f = File::from_string("abc");
    f.attrs().set("checksumType", "SHA256");
    f.attrs().set("checksum", upper);
    read_all(f);
    EXPECT_TRUE(f.verify().is_ok());
}

TEST(FileTest, VerifyDetectsTampering) {
    File f = File::from_string("abd");
    f.attrs().set("checksumType", "SHA256");
    f.attrs().set("checksum", std::string(kAbcSha256));
    read_all(f);

    auto res = f.verify();
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::ChecksumMismatch));
    EXPECT_EQ(f.checksum_state(), ChecksumState::Failed);
}

TEST(FileTest, VerifyWithoutChecksumIsMissing) {
    File f = File::from_string("abc");
    read_all(f);
    auto res = f.verify();
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::ChecksumMissing));
    EXPECT_EQ(f.checksum_state(), ChecksumState::Unverified);
}

TEST(FileTest, VerifyUnknownAlgorithmReportsIt) {
    File f = File::from_string("abc");
    f.attrs().set("checksumType", "CRC32");
    f.attrs().set("checksum", "00000000");
    read_all(f);
    auto res = f.verify();
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::UnknownChecksum));
}

TEST(FileTest, VerifyEmptyFileAlwaysPasses) {
    File f = File::from_string("");
    EXPECT_TRUE(f.verify().is_ok());
}

TEST(FileTest, ChecksumTransitionsOnlyMoveForward) {
    using flowfile::checksum_transition_allowed;
    EXPECT_TRUE(checksum_transition_allowed(ChecksumState::Uninitialized, ChecksumState::Computing));
    EXPECT_TRUE(checksum_transition_allowed(ChecksumState::Uninitialized, ChecksumState::Unverified));
    EXPECT_TRUE(checksum_transition_allowed(ChecksumState::Computing, ChecksumState::Passed));
    EXPECT_TRUE(checksum_transition_allowed(ChecksumState::Computing, ChecksumState::Failed));
    EXPECT_FALSE(checksum_transition_allowed(ChecksumState::Passed, ChecksumState::Computing));
    EXPECT_FALSE(checksum_transition_allowed(ChecksumState::Failed, ChecksumState::Passed));
    EXPECT_FALSE(checksum_transition_allowed(ChecksumState::Unverified, ChecksumState::Computing));
}

TEST(FileTest, BufferMakesSequentialResettable) {
    File f = sequential("abc", 3);
    f.attrs().set("checksumType", "SHA256");
    f.attrs().set("checksum", std::string(kAbcSha256));

    ASSERT_TRUE(f.buffer().is_ok());
    EXPECT_TRUE(f.can_reset());
    EXPECT_EQ(f.checksum_state(), ChecksumState::Passed);
    EXPECT_EQ(read_all(f), "abc");
    ASSERT_TRUE(f.reset().is_ok());
    EXPECT_EQ(read_all(f), "abc");
    EXPECT_TRUE(f.verify().is_ok());
}

TEST(FileTest, BufferAfterPartialReadFails) {
    File f = sequential("abc", 3);
    std::uint8_t buf[1];
    ASSERT_TRUE(f.read(buf, 1).is_ok());
    auto res = f.buffer();
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::InvalidArgument));
}

TEST(FileTest, FromPathRecordsMetadataAndOpensLazily) {
    const auto dir = create_temp_dir();
    const auto path = dir / "data.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "on disk";
    }

    auto opened = File::from_path(path);
    ASSERT_TRUE(opened.is_ok());
    File& f = opened.value();
    EXPECT_EQ(f.kind(), File::BackingKind::DeferredPath);
    EXPECT_EQ(f.size(), 7u);
    EXPECT_EQ(f.attrs().get("filename"), "data.txt");
    EXPECT_EQ(f.attrs().get("path"), dir.string() + "/");
    EXPECT_EQ(f.attrs().get("uuid").size(), 36u);
    EXPECT_FALSE(f.attrs().get("file.lastModifiedTime").empty());
    EXPECT_EQ(f.attrs().get("file.permissions").size(), 10u);
    EXPECT_EQ(f.attrs().get("file.permissions")[0], '-');

    EXPECT_EQ(f.file_path(), path);
    EXPECT_EQ(read_all(f), "on disk");
    ASSERT_TRUE(f.close().is_ok());
    fs::remove_all(dir);
}

TEST(FileTest, FromPathDirectoryAndLink) {
    const auto dir = create_temp_dir();
    fs::create_directories(dir / "sub");
    {
        std::ofstream out(dir / "target.txt");
        out << "x";
    }
    fs::create_symlink("target.txt", dir / "link");

    auto sub = File::from_path(dir / "sub");
    ASSERT_TRUE(sub.is_ok());
    EXPECT_EQ(sub.value().attrs().get("kind"), "dir");
    EXPECT_EQ(sub.value().size(), 0u);

    auto link = File::from_path(dir / "link");
    ASSERT_TRUE(link.is_ok());
    EXPECT_EQ(link.value().attrs().get("kind"), "link");
    EXPECT_EQ(link.value().attrs().get("target"), "target.txt");
    fs::remove_all(dir);
}

TEST(FileTest, FromPathMissingIsIoError) {
    auto res = File::from_path("/nonexistent/flowfile/none.bin");
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::Io));
}
