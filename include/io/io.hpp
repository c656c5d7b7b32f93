#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace stash {

class IReader {
public:
    virtual ~IReader() = default;
    // Returns bytes read, 0 at end of stream, -1 on error (errno set).
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

} // namespace stash
