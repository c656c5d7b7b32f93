#include "archive/archive_extractor.hpp"

#include "archive/path_sanitizer.hpp"
#include "archive/tar_zstd_reader.hpp"
#include "io/memory_reader.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <system_error>

namespace stash {

namespace fs = std::filesystem;

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string WriterErr(archive* aw) {
    const char* s = aw ? archive_error_string(aw) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

// Resolves the root once so later symlink checks by the disk writer never
// trip over links that sit above the destination (e.g. a symlinked $TMPDIR).
fs::path ResolveRoot(const fs::path& destination_root) {
    std::error_code ec;
    fs::path root = fs::absolute(destination_root, ec);
    if (ec) root = destination_root;

    fs::create_directories(root, ec);
    if (ec) {
        LogDebug("cannot create destination %s: %s", root.c_str(), ec.message().c_str());
    }

    fs::path resolved = fs::weakly_canonical(root, ec);
    if (ec) return root.lexically_normal();
    return resolved;
}

// Creates the directories between `root` and `target`'s parent. Walks with
// lstat and stops at the first symlink or non-directory so nothing is ever
// created through a link; the disk writer then decides what to do with it.
void EnsureParentDirs(const fs::path& root, const fs::path& target) {
    const fs::path rel = target.parent_path().lexically_relative(root);
    if (rel.empty() || rel == ".") return;

    fs::path cur = root;
    for (const auto& part : rel) {
        cur /= part;
        struct stat st{};
        if (::lstat(cur.c_str(), &st) == 0) {
            if (S_ISDIR(st.st_mode)) continue;
            LogDebug("not creating directories below %s: not a directory", cur.c_str());
            return;
        }
        if (errno != ENOENT || ::mkdir(cur.c_str(), 0755) != 0) {
            LogDebug("mkdir %s: %s", cur.c_str(), std::strerror(errno));
            return;
        }
    }
}

} // namespace

Result ArchiveExtractor::Extract(std::span<const std::uint8_t> compressed,
                                 const fs::path& destination_root) const {
    SpanReader source(compressed);
    TarZstdReader reader;
    auto open_res = reader.Open(source);
    if (!open_res.is_ok()) return open_res;

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorKind::Extract, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (opt_.preserve_permissions) flags |= ARCHIVE_EXTRACT_PERM;
    if (opt_.preserve_times) flags |= ARCHIVE_EXTRACT_TIME;
    // Entry paths are rewritten to absolute paths under the root, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    const fs::path root = ResolveRoot(destination_root);
    const PathSanitizer sanitizer(root, opt_.strip_components);

    std::uint64_t written = 0;
    std::uint64_t skipped = 0;
    ArchiveEntry entry;

    while (true) {
        const auto next = reader.Next(entry);
        if (next == TarZstdReader::NextStatus::End) break;
        if (next == TarZstdReader::NextStatus::Error) {
            return Result::Fail(ErrorKind::ArchiveFormat, "archive_read_next_header: " + reader.LastError());
        }

        PathSanitizer::Rejection why{};
        auto target = sanitizer.Sanitize(entry.path, &why);
        if (!target) {
            if (why == PathSanitizer::Rejection::EmptyRemainder) {
                LogDebug("skipping %s: %s", entry.path.c_str(), RejectionName(why));
            } else {
                LogWarn("skipping unsafe archive entry %s: %s", entry.path.c_str(), RejectionName(why));
            }
            ++skipped;
            continue;
        }
        if (*target == sanitizer.Root()) {
            if (entry.type != EntryType::Directory) {
                LogWarn("skipping archive entry that would replace the destination: %s", entry.path.c_str());
                ++skipped;
            }
            continue;
        }

        if (entry.type == EntryType::Hardlink) {
            auto link = sanitizer.Sanitize(entry.link_target);
            if (!link || *link == sanitizer.Root()) {
                LogWarn("skipping hardlink with unsafe target: %s -> %s",
                        entry.path.c_str(), entry.link_target.c_str());
                ++skipped;
                continue;
            }
            archive_entry_set_hardlink(entry.handle, link->c_str());
        }

        EnsureParentDirs(sanitizer.Root(), *target);

        archive_entry_set_pathname(entry.handle, target->c_str());
        LogDebug("extract %s: %s", EntryTypeName(entry.type), target->c_str());

        const int wh = archive_write_header(aw.get(), entry.handle);
        if (wh < ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::Extract, "cannot create " + target->string() + ": " + WriterErr(aw.get()));
        }
        if (wh == ARCHIVE_WARN) {
            LogWarn("%s: %s", target->c_str(), WriterErr(aw.get()).c_str());
        }

        DataBlock block;
        while (true) {
            const auto rs = reader.ReadBlock(block);
            if (rs == TarZstdReader::BlockStatus::End) break;
            if (rs == TarZstdReader::BlockStatus::Error) {
                return Result::Fail(ErrorKind::ArchiveFormat,
                                    "archive_read_data_block: " + reader.LastError());
            }

            const la_ssize_t ww = archive_write_data_block(aw.get(), block.data, block.size, block.offset);
            if (ww < ARCHIVE_WARN) {
                return Result::Fail(ErrorKind::Extract, "cannot write " + target->string() + ": " + WriterErr(aw.get()));
            }
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf < ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::Extract, "cannot finish " + target->string() + ": " + WriterErr(aw.get()));
        }
        ++written;
    }

    if (archive_write_close(aw.get()) < ARCHIVE_WARN) {
        return Result::Fail(ErrorKind::Extract, "archive_write_close: " + WriterErr(aw.get()));
    }

    LogInfo("extracted %llu entries into %s (%llu skipped)",
            (unsigned long long)written, root.c_str(), (unsigned long long)skipped);
    return Result::Ok();
}

Result UnpackTarball(std::span<const std::uint8_t> compressed,
                     const fs::path& destination_root,
                     std::size_t strip_components) {
    ArchiveExtractor::Options opt;
    opt.strip_components = strip_components;
    return ArchiveExtractor(opt).Extract(compressed, destination_root);
}

} // namespace stash
