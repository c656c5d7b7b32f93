#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

struct archive;
struct archive_entry;

namespace stash {

enum class EntryType {
    Regular,
    Directory,
    Symlink,
    Hardlink,
    Other,
};

const char* EntryTypeName(EntryType type);

// One header of the archive. Valid until the next TarZstdReader::Next().
struct ArchiveEntry {
    std::string path;
    std::string link_target;
    EntryType type = EntryType::Other;
    mode_t perm = 0;
    std::int64_t size = 0;

    // Owned by the reader.
    archive_entry* handle = nullptr;
};

struct DataBlock {
    const void* data = nullptr;
    std::size_t size = 0;
    std::int64_t offset = 0;
};

struct ArchiveSourceCtx;

struct ArchiveReadDeleter {
    void operator()(archive* a) const;
};

// Reads a zstd-compressed tar stream entry by entry. The source must outlive
// the reader.
class TarZstdReader {
  public:
    enum class NextStatus { Entry, End, Error };
    enum class BlockStatus { Data, End, Error };

    TarZstdReader();
    ~TarZstdReader();

    TarZstdReader(const TarZstdReader&) = delete;
    TarZstdReader& operator=(const TarZstdReader&) = delete;

    // Fails with ErrorKind::Decode when the stream is not zstd-compressed.
    Result Open(IReader& source);

    NextStatus Next(ArchiveEntry& out);

    // Sparse-aware block read of the current entry's content.
    BlockStatus ReadBlock(DataBlock& out);

    // Sequential read of the current entry's content. Same contract as IReader::Read.
    ssize_t ReadData(void* buf, std::size_t len);

    Result SkipData();

    std::string LastError() const;

  private:
    std::unique_ptr<ArchiveSourceCtx> src_;
    std::unique_ptr<archive, ArchiveReadDeleter> ar_;
};

// IReader over the current entry of a TarZstdReader.
class EntryContentReader final : public IReader {
  public:
    explicit EntryContentReader(TarZstdReader& reader) : reader_(reader) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        return reader_.ReadData(out.data(), out.size());
    }

  private:
    TarZstdReader& reader_;
};

} // namespace stash
