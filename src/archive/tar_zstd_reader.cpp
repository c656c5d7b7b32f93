#include "archive/tar_zstd_reader.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <span>
#include <sys/stat.h>

namespace stash {

void ArchiveReadDeleter::operator()(archive* a) const {
    if (a) archive_read_free(a);
}

// Owned by the reader rather than by libarchive: libarchive may invoke the
// close callback on a failed open, so the context must not free itself there.
struct ArchiveSourceCtx {
    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;

    explicit ArchiveSourceCtx(IReader& in, size_t buffer_size = 64 * 1024)
        : reader(&in), buffer(buffer_size) {}
};

namespace {

la_ssize_t ReadCb(struct archive* a, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ArchiveSourceCtx*>(client_data);
    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) {
        archive_set_error(a, errno ? errno : EIO, "source read failed");
        return -1;
    }
    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

EntryType ClassifyEntry(archive_entry* e) {
    const char* hl = archive_entry_hardlink(e);
    if (hl && *hl) return EntryType::Hardlink;
    switch (archive_entry_filetype(e)) {
        case AE_IFREG: return EntryType::Regular;
        case AE_IFDIR: return EntryType::Directory;
        case AE_IFLNK: return EntryType::Symlink;
        default:       return EntryType::Other;
    }
}

} // namespace

const char* EntryTypeName(EntryType type) {
    switch (type) {
        case EntryType::Regular:   return "file";
        case EntryType::Directory: return "directory";
        case EntryType::Symlink:   return "symlink";
        case EntryType::Hardlink:  return "hardlink";
        case EntryType::Other:     return "other";
    }
    return "other";
}

TarZstdReader::TarZstdReader() = default;
TarZstdReader::~TarZstdReader() = default;

Result TarZstdReader::Open(IReader& source) {
    ar_.reset(archive_read_new());
    if (!ar_) return Result::Fail(ErrorKind::Decode, "archive_read_new failed");

    if (archive_read_support_filter_zstd(ar_.get()) < ARCHIVE_WARN) {
        return Result::Fail(ErrorKind::Decode, "zstd filter unavailable: " + LastError());
    }
    archive_read_support_format_tar(ar_.get());
    archive_read_support_format_gnutar(ar_.get());

    src_ = std::make_unique<ArchiveSourceCtx>(source);
    if (archive_read_open2(ar_.get(), src_.get(), nullptr, ReadCb, nullptr, nullptr) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Decode, "cannot open compressed stream: " + LastError());
    }

    // Filter 0 is the one closest to the format; "none" means the bytes were
    // not zstd at all.
    if (archive_filter_code(ar_.get(), 0) != ARCHIVE_FILTER_ZSTD) {
        return Result::Fail(ErrorKind::Decode, "input is not zstd-compressed");
    }
    return Result::Ok();
}

TarZstdReader::NextStatus TarZstdReader::Next(ArchiveEntry& out) {
    out = ArchiveEntry{};
    if (!ar_) return NextStatus::Error;

    archive_entry* e = nullptr;
    const int r = archive_read_next_header(ar_.get(), &e);
    if (r == ARCHIVE_EOF) return NextStatus::End;
    if (r < ARCHIVE_WARN) return NextStatus::Error;

    const char* name = archive_entry_pathname(e);
    out.path = name ? name : "";
    out.type = ClassifyEntry(e);
    if (out.type == EntryType::Hardlink) {
        out.link_target = archive_entry_hardlink(e);
    } else if (out.type == EntryType::Symlink) {
        const char* target = archive_entry_symlink(e);
        out.link_target = target ? target : "";
    }
    out.perm = archive_entry_perm(e);
    out.size = archive_entry_size_is_set(e) ? archive_entry_size(e) : 0;
    out.handle = e;
    return NextStatus::Entry;
}

TarZstdReader::BlockStatus TarZstdReader::ReadBlock(DataBlock& out) {
    out = DataBlock{};
    if (!ar_) return BlockStatus::Error;

    la_int64_t offset = 0;
    const int r = archive_read_data_block(ar_.get(), &out.data, &out.size, &offset);
    if (r == ARCHIVE_EOF) return BlockStatus::End;
    if (r < ARCHIVE_WARN) return BlockStatus::Error;
    out.offset = static_cast<std::int64_t>(offset);
    return BlockStatus::Data;
}

ssize_t TarZstdReader::ReadData(void* buf, std::size_t len) {
    if (!ar_) return -1;
    const la_ssize_t n = archive_read_data(ar_.get(), buf, len);
    return n < 0 ? -1 : static_cast<ssize_t>(n);
}

Result TarZstdReader::SkipData() {
    if (!ar_ || archive_read_data_skip(ar_.get()) < ARCHIVE_WARN) {
        return Result::Fail(ErrorKind::ArchiveFormat, "cannot skip entry data: " + LastError());
    }
    return Result::Ok();
}

std::string TarZstdReader::LastError() const {
    const char* s = ar_ ? archive_error_string(ar_.get()) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace stash
