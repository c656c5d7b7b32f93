#include "io/fd.hpp"

#include <unistd.h>

namespace stash {

namespace {

bool IsStandardStream(int fd) {
    return fd == STDIN_FILENO || fd == STDOUT_FILENO || fd == STDERR_FILENO;
}

} // namespace

UniqueFd::UniqueFd(int fd) : fd_(fd) {}

UniqueFd::UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

UniqueFd::~UniqueFd() { (void)Close(); }

void UniqueFd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int UniqueFd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

int UniqueFd::Close() {
    int rc = 0;
    if (fd_ >= 0 && !IsStandardStream(fd_)) {
        rc = ::close(fd_);
    }
    fd_ = -1;
    return rc;
}

} // namespace stash
