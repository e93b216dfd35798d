#include "flowfile/checksum/checksum.hpp"
#include "flowfile/segment/save.hpp"
#include "flowfile/segment/segmenter.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using flowfile::ErrorCode;
using flowfile::File;
using flowfile::SaveOptions;
namespace segment = flowfile::segment;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() / fs::path("flowfile_save_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

SaveOptions fast_options() {
    SaveOptions options;
    options.reassembly_attempts = 2;
    options.reassembly_delay = std::chrono::milliseconds(5);
    return options;
}

File checksummed(const std::string& content, const std::string& path, const std::string& name) {
    flowfile::checksum::ChecksumEngine engine;
    File f = File::from_string(content);
    f.attrs().set("path", path).set("filename", name);
    EXPECT_TRUE(engine.add_checksum(f, "SHA256").is_ok());
    return f;
}

} // namespace

TEST(SaveTest, WritesWholeFileAndVerifies) {
    const auto dir = create_temp_dir();
    File f = checksummed("hello flowfile", "nested/dir/", "greeting.txt");
    f.attrs().set("file.lastModifiedTime", "2020-01-01T00:00:00Z");

    auto saved = segment::save(f, dir, fast_options());
    ASSERT_TRUE(saved.is_ok()) << saved.error().describe();
    EXPECT_EQ(saved.value(), dir / "nested/dir/greeting.txt");
    EXPECT_EQ(read_file(saved.value()), "hello flowfile");

    struct stat st{};
    ASSERT_EQ(::stat(saved.value().c_str(), &st), 0);
    EXPECT_EQ(st.st_mtime, 1577836800);
    fs::remove_all(dir);
}

TEST(SaveTest, TamperedContentIsRejected) {
    const auto dir = create_temp_dir();
    File f = checksummed("original", "./", "data.bin");
    f.attrs().set("checksum", std::string(64, '0'));

    auto saved = segment::save(f, dir, fast_options());
    ASSERT_TRUE(saved.is_error());
    EXPECT_TRUE(saved.error().is(ErrorCode::ChecksumMismatch));
    fs::remove_all(dir);
}

TEST(SaveTest, MissingChecksumHonoursOption) {
    const auto dir = create_temp_dir();
    File strict = File::from_string("no checksum");
    strict.attrs().set("filename", "a.txt");
    auto rejected = segment::save(strict, dir, fast_options());
    ASSERT_TRUE(rejected.is_error());
    EXPECT_TRUE(rejected.error().is(ErrorCode::ChecksumMissing));

    auto lenient_options = fast_options();
    lenient_options.require_checksum = false;
    File lenient = File::from_string("no checksum");
    lenient.attrs().set("filename", "b.txt");
    auto kept = segment::save(lenient, dir, lenient_options);
    ASSERT_TRUE(kept.is_ok());
    EXPECT_EQ(read_file(kept.value()), "no checksum");
    fs::remove_all(dir);
}

TEST(SaveTest, RejectsEscapingPathsAndBadNames) {
    const auto dir = create_temp_dir();
    File escaping = File::from_string("x");
    escaping.attrs().set("path", "../../etc/").set("filename", "passwd");
    auto res = segment::save(escaping, dir, fast_options());
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::InvalidArgument));

    File unnamed = File::from_string("x");
    res = segment::save(unnamed, dir, fast_options());
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::InvalidArgument));

    File odd_kind = File::from_string("");
    odd_kind.attrs().set("filename", "fifo").set("kind", "pipe");
    res = segment::save(odd_kind, dir, fast_options());
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::InvalidArgument));
    fs::remove_all(dir);
}

TEST(SaveTest, AbsolutePathIsPlacedUnderBase) {
    const auto dir = create_temp_dir();
    File f = checksummed("abs", "/var/data/", "abs.txt");
    auto saved = segment::save(f, dir, fast_options());
    ASSERT_TRUE(saved.is_ok());
    EXPECT_EQ(saved.value(), dir / "var/data/abs.txt");
    fs::remove_all(dir);
}

TEST(SaveTest, CreatesDirectoriesAndLinks) {
    const auto dir = create_temp_dir();
    File sub = File::from_string("");
    sub.attrs().set("path", "./").set("filename", "subdir").set("kind", "dir");
    auto made = segment::save(sub, dir, fast_options());
    ASSERT_TRUE(made.is_ok());
    EXPECT_TRUE(fs::is_directory(dir / "subdir"));

    File link = File::from_string("");
    link.attrs().set("path", "./").set("filename", "alias").set("kind", "link").set("target", "subdir");
    ASSERT_TRUE(segment::save(link, dir, fast_options()).is_ok());
    EXPECT_TRUE(fs::is_symlink(dir / "alias"));
    EXPECT_EQ(fs::read_symlink(dir / "alias"), fs::path("subdir"));

    File outside = File::from_string("");
    outside.attrs().set("path", "./").set("filename", "escape").set("kind", "link").set("target", "../../etc");
    ASSERT_TRUE(segment::save(outside, dir, fast_options()).is_ok());
    EXPECT_FALSE(fs::exists(fs::symlink_status(dir / "escape")));
    fs::remove_all(dir);
}

TEST(SaveTest, ReassemblesFragmentsOutOfOrder) {
    const auto dir = create_temp_dir();
    std::string content;
    for (int i = 0; i < 1000; ++i) {
        content += "line " + std::to_string(i) + "\n";
    }
    File parent = checksummed(content, "./", "reassembled.txt");
    auto fragments = segment::segment_by_size(parent, 1000);
    ASSERT_TRUE(fragments.is_ok());
    auto& parts = fragments.value();
    ASSERT_GT(parts.size(), 3u);

    std::vector<std::thread> writers;
    std::vector<flowfile::Result<fs::path>> results(parts.size(), flowfile::Err<fs::path>(ErrorCode::Io, "unset"));
    for (std::size_t i = parts.size(); i-- > 0;) {
        writers.emplace_back([&, i] { results[i] = segment::save(parts[i], dir, fast_options()); });
    }
    for (auto& w : writers) {
        w.join();
    }
    for (const auto& r : results) {
        ASSERT_TRUE(r.is_ok()) << r.error().describe();
    }

    const auto target = dir / "reassembled.txt";
    EXPECT_EQ(read_file(target), content);

    flowfile::checksum::ChecksumEngine engine;
    EXPECT_TRUE(engine.verify_parent(target, parts.front().attrs()).is_ok());
    fs::remove_all(dir);
}

TEST(SaveTest, FragmentTimesOutWhenTargetNeverGrows) {
    const auto dir = create_temp_dir();
    {
        std::ofstream stale(dir / "partial.bin", std::ios::binary);
        stale << "abc";
    }
    File fragment = File::from_string("xyz");
    fragment.attrs()
        .set("filename", "partial.bin")
        .set("fragment.identifier", "parent")
        .set("fragment.offset", "3")
        .set("fragment.count", "2")
        .set("segment.original.size", "6");

    auto res = segment::save(fragment, dir, fast_options());
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::ReassemblyTimeout));
    fs::remove_all(dir);
}

TEST(SaveTest, FragmentOutsideOriginalSizeIsMalformed) {
    const auto dir = create_temp_dir();
    File fragment = File::from_string("xyz");
    fragment.attrs()
        .set("filename", "bad.bin")
        .set("fragment.offset", "5")
        .set("segment.original.size", "6");
    auto res = segment::save(fragment, dir, fast_options());
    ASSERT_TRUE(res.is_error());
    EXPECT_TRUE(res.error().is(ErrorCode::Malformed));
    fs::remove_all(dir);
}
