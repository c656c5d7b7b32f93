#pragma once

#include <archive.h>
#include <archive_entry.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/stashkit_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

struct TarEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
    mode_t perm = 0644;
    // Symlink target for AE_IFLNK, hardlink target when `hardlink` is set.
    std::string link;
    bool hardlink = false;
};

enum class Compression { Zstd, Gzip, None };

namespace detail {

struct WriterGuard {
    archive* a;
    ~WriterGuard() {
        if (a) (void)archive_write_free(a);
    }
};

inline void Check(int rc, archive* a, const char* what) {
    if (rc < ARCHIVE_WARN) {
        const char* e = archive_error_string(a);
        throw std::runtime_error(std::string(what) + ": " + (e ? e : "unknown"));
    }
}

inline void AddFilter(archive* a, Compression c) {
    switch (c) {
        case Compression::Zstd: Check(archive_write_add_filter_zstd(a), a, "add_filter_zstd"); break;
        case Compression::Gzip: Check(archive_write_add_filter_gzip(a), a, "add_filter_gzip"); break;
        case Compression::None: break;
    }
}

} // namespace detail

inline std::vector<std::uint8_t> BuildTar(const std::vector<TarEntry>& entries,
                                          Compression compression = Compression::Zstd) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    detail::WriterGuard w{archive_write_new()};
    if (!w.a) throw std::runtime_error("archive_write_new failed");
    detail::Check(archive_write_set_format_pax_restricted(w.a), w.a, "set_format_pax_restricted");
    detail::AddFilter(w.a, compression);
    detail::Check(archive_write_open_memory(w.a, out.data(), out.size(), &used), w.a, "open_memory");

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) throw std::runtime_error("archive_entry_new failed");

        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_perm(hdr, entry.perm);
        if (entry.hardlink) {
            archive_entry_set_filetype(hdr, AE_IFREG);
            archive_entry_set_hardlink(hdr, entry.link.c_str());
            archive_entry_set_size(hdr, 0);
        } else {
            archive_entry_set_filetype(hdr, entry.file_type);
            if (entry.file_type == AE_IFLNK) {
                archive_entry_set_symlink(hdr, entry.link.c_str());
            }
            archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        }

        const int rc = archive_write_header(w.a, hdr);
        if (rc < ARCHIVE_WARN) {
            archive_entry_free(hdr);
            detail::Check(rc, w.a, "write_header");
        }
        if (!entry.hardlink && !entry.contents.empty()) {
            if (archive_write_data(w.a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                detail::Check(ARCHIVE_FATAL, w.a, "write_data");
            }
        }
        archive_entry_free(hdr);
    }

    detail::Check(archive_write_close(w.a), w.a, "write_close");
    out.resize(used);
    return out;
}

// zstd-compresses `payload` without any tar structure around it.
inline std::vector<std::uint8_t> ZstdCompressRaw(const std::string& payload) {
    std::vector<std::uint8_t> out(1024 * 1024);
    size_t used = 0;

    detail::WriterGuard w{archive_write_new()};
    if (!w.a) throw std::runtime_error("archive_write_new failed");
    detail::Check(archive_write_set_format_raw(w.a), w.a, "set_format_raw");
    detail::AddFilter(w.a, Compression::Zstd);
    detail::Check(archive_write_open_memory(w.a, out.data(), out.size(), &used), w.a, "open_memory");

    archive_entry* hdr = archive_entry_new();
    archive_entry_set_pathname(hdr, "payload");
    archive_entry_set_filetype(hdr, AE_IFREG);
    archive_entry_set_size(hdr, static_cast<la_int64_t>(payload.size()));
    const int rc = archive_write_header(w.a, hdr);
    archive_entry_free(hdr);
    detail::Check(rc, w.a, "write_header");
    if (!payload.empty() && archive_write_data(w.a, payload.data(), payload.size()) < 0) {
        detail::Check(ARCHIVE_FATAL, w.a, "write_data");
    }

    detail::Check(archive_write_close(w.a), w.a, "write_close");
    out.resize(used);
    return out;
}

inline std::string ReadFile(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::filesystem::path& p, const std::string& data) {
    std::ofstream os(p, std::ios::binary);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!os.good()) throw std::runtime_error("cannot write " + p.string());
}

// Counts every filesystem object below `dir`, not following symlinks.
inline size_t CountTree(const std::filesystem::path& dir) {
    size_t n = 0;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        ++n;
    }
    return n;
}

} // namespace testutil
