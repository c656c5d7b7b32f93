#include "archive/tar_zstd_reader.hpp"
#include "io/memory_reader.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

namespace stash {
namespace {

std::string ReadContent(TarZstdReader& reader) {
    EntryContentReader content(reader);
    std::string out;
    std::array<std::uint8_t, 7> buf{};
    while (true) {
        const ssize_t n = content.Read(buf);
        if (n <= 0) break;
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

TEST(TarZstdReaderTest, YieldsEntriesInContainerOrder) {
    const auto tar = testutil::BuildTar({
        {.path = "pkg/", .file_type = AE_IFDIR, .perm = 0755},
        {.path = "pkg/bin/tool", .contents = "#!/bin/sh\necho hi\n", .perm = 0755},
        {.path = "pkg/link", .file_type = AE_IFLNK, .perm = 0777, .link = "bin/tool"},
    });

    SpanReader source(tar);
    TarZstdReader reader;
    auto open = reader.Open(source);
    ASSERT_TRUE(open.is_ok()) << open.msg;

    ArchiveEntry e;
    ASSERT_EQ(reader.Next(e), TarZstdReader::NextStatus::Entry);
    EXPECT_EQ(e.path, "pkg/");
    EXPECT_EQ(e.type, EntryType::Directory);

    ASSERT_EQ(reader.Next(e), TarZstdReader::NextStatus::Entry);
    EXPECT_EQ(e.path, "pkg/bin/tool");
    EXPECT_EQ(e.type, EntryType::Regular);
    EXPECT_EQ(e.perm, static_cast<mode_t>(0755));
    EXPECT_EQ(e.size, 18);
    EXPECT_EQ(ReadContent(reader), "#!/bin/sh\necho hi\n");

    ASSERT_EQ(reader.Next(e), TarZstdReader::NextStatus::Entry);
    EXPECT_EQ(e.type, EntryType::Symlink);
    EXPECT_EQ(e.link_target, "bin/tool");

    EXPECT_EQ(reader.Next(e), TarZstdReader::NextStatus::End);
}

TEST(TarZstdReaderTest, UnreadContentIsSkippedByNext) {
    const auto tar = testutil::BuildTar({
        {.path = "a.txt", .contents = std::string(100000, 'a')},
        {.path = "b.txt", .contents = "b"},
    });

    SpanReader source(tar);
    TarZstdReader reader;
    ASSERT_TRUE(reader.Open(source).is_ok());

    ArchiveEntry e;
    ASSERT_EQ(reader.Next(e), TarZstdReader::NextStatus::Entry);
    ASSERT_EQ(reader.Next(e), TarZstdReader::NextStatus::Entry);
    EXPECT_EQ(e.path, "b.txt");
    EXPECT_EQ(ReadContent(reader), "b");
}

TEST(TarZstdReaderTest, ReportsHardlinks) {
    const auto tar = testutil::BuildTar({
        {.path = "data", .contents = "x"},
        {.path = "alias", .link = "data", .hardlink = true},
    });

    SpanReader source(tar);
    TarZstdReader reader;
    ASSERT_TRUE(reader.Open(source).is_ok());

    ArchiveEntry e;
    ASSERT_EQ(reader.Next(e), TarZstdReader::NextStatus::Entry);
    ASSERT_EQ(reader.Next(e), TarZstdReader::NextStatus::Entry);
    EXPECT_EQ(e.type, EntryType::Hardlink);
    EXPECT_EQ(e.link_target, "data");
}

TEST(TarZstdReaderTest, UncompressedTarIsADecodeError) {
    const auto tar = testutil::BuildTar({{.path = "a.txt", .contents = "a"}}, testutil::Compression::None);

    SpanReader source(tar);
    TarZstdReader reader;
    auto res = reader.Open(source);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Decode);
}

TEST(TarZstdReaderTest, OtherCompressionIsADecodeError) {
    const auto tar = testutil::BuildTar({{.path = "a.txt", .contents = "a"}}, testutil::Compression::Gzip);

    SpanReader source(tar);
    TarZstdReader reader;
    auto res = reader.Open(source);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Decode);
}

TEST(TarZstdReaderTest, EmptyInputIsADecodeError) {
    const std::vector<std::uint8_t> empty;
    SpanReader source(empty);
    TarZstdReader reader;
    auto res = reader.Open(source);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Decode);
}

TEST(TarZstdReaderTest, ZstdPayloadThatIsNotTarFailsOnFirstHeader) {
    const auto blob = testutil::ZstdCompressRaw(std::string(4096, 'z'));

    SpanReader source(blob);
    TarZstdReader reader;
    auto open = reader.Open(source);
    ASSERT_TRUE(open.is_ok()) << open.msg;

    ArchiveEntry e;
    EXPECT_EQ(reader.Next(e), TarZstdReader::NextStatus::Error);
    EXPECT_FALSE(reader.LastError().empty());
}

} // namespace
} // namespace stash
