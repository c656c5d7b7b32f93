#pragma once

namespace stash {

// Owns a POSIX file descriptor. Standard streams are never closed.
class UniqueFd {
  public:
    UniqueFd() = default;
    explicit UniqueFd(int fd);

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept;
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    ~UniqueFd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd = -1);
    int Release();

    // Returns the close(2) result so writers can detect deferred write errors.
    int Close();

  private:
    int fd_{-1};
};

} // namespace stash
