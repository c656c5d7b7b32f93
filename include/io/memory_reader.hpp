#pragma once

#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <span>

namespace stash {

// Non-owning reader over a caller-held buffer. The buffer must outlive the reader.
class SpanReader final : public IReader {
  public:
    explicit SpanReader(std::span<const std::uint8_t> data) : data_(data) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size()) return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::memcpy(out.data(), data_.data() + pos_, n);
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::span<const std::uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace stash
