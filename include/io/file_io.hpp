#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>
#include <vector>

namespace stash {

// Reads a regular file, or stdin when the path is "-".
class InputFile final : public IReader {
public:
    static Result Open(std::string path, InputFile& out);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    UniqueFd fd_;
    std::optional<std::uint64_t> size_;
};

Result ReadAll(IReader& reader, std::vector<std::uint8_t>& out);

// Loads a whole file ("-" for stdin) into memory.
Result LoadFile(const std::string& path, std::vector<std::uint8_t>& out);

// Writes `data` to `path` through a temporary sibling file and rename(2), so a
// reader never observes a partial file. "-" writes to stdout instead.
Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> data, mode_t mode);

} // namespace stash
