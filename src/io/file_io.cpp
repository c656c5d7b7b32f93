#include "io/file_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace stash {

namespace {

std::string ErrnoText(int e) { return std::string(std::strerror(e)); }

Result WriteAllToFd(int fd, std::span<const std::uint8_t> data, const std::string& what) {
    size_t done = 0;
    while (done < data.size()) {
        const ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int e = errno;
            return Result::Fail(ErrorKind::Io, e, "write failed: " + what + " (" + ErrnoText(e) + ")");
        }
        done += static_cast<size_t>(n);
    }
    return Result::Ok();
}

} // namespace

Result InputFile::Open(std::string path, InputFile& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        out.size_ = std::nullopt;
        return Result::Ok();
    }

    const int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "cannot open " + out.path_ + " (" + ErrnoText(e) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }
    return Result::Ok();
}

ssize_t InputFile::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) return n;
        if (errno == EINTR) continue;
        return -1;
    }
}

Result ReadAll(IReader& reader, std::vector<std::uint8_t>& out) {
    out.clear();
    if (auto total = reader.TotalSize()) {
        out.reserve(static_cast<size_t>(*total));
    }

    std::uint8_t buf[64 * 1024];
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf, sizeof(buf)));
        if (n == 0) break;
        if (n < 0) {
            const int e = errno;
            return Result::Fail(ErrorKind::Io, e, "read failed (" + ErrnoText(e) + ")");
        }
        out.insert(out.end(), buf, buf + n);
    }
    return Result::Ok();
}

Result LoadFile(const std::string& path, std::vector<std::uint8_t>& out) {
    InputFile in;
    auto r = InputFile::Open(path, in);
    if (!r.is_ok()) return r;

    r = ReadAll(in, out);
    if (!r.is_ok()) {
        r.msg += ": " + path;
    }
    return r;
}

Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> data, mode_t mode) {
    if (path == "-") {
        return WriteAllToFd(STDOUT_FILENO, data, "<stdout>");
    }

    std::string tmp = path + ".tmpXXXXXX";
    UniqueFd fd(::mkstemp(tmp.data()));
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "cannot create temporary file for " + path + " (" + ErrnoText(e) + ")");
    }

    auto fail = [&](const std::string& what) {
        const int e = errno;
        (void)fd.Close();
        (void)::unlink(tmp.c_str());
        return Result::Fail(ErrorKind::Io, e, what + ": " + path + " (" + ErrnoText(e) + ")");
    };

    if (::fchmod(fd.Get(), mode) != 0) return fail("fchmod failed");

    auto w = WriteAllToFd(fd.Get(), data, tmp);
    if (!w.is_ok()) {
        (void)fd.Close();
        (void)::unlink(tmp.c_str());
        return w;
    }

    if (::fsync(fd.Get()) != 0) return fail("fsync failed");
    if (fd.Close() != 0) {
        const int e = errno;
        (void)::unlink(tmp.c_str());
        return Result::Fail(ErrorKind::Io, e, "close failed: " + path + " (" + ErrnoText(e) + ")");
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const int e = errno;
        (void)::unlink(tmp.c_str());
        return Result::Fail(ErrorKind::Io, e, "rename failed: " + path + " (" + ErrnoText(e) + ")");
    }
    return Result::Ok();
}

} // namespace stash
