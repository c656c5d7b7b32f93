#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace stash {

class ArchiveExtractor {
  public:
    struct Options {
        // Leading path components dropped from every entry (tar --strip-components).
        std::size_t strip_components = 0;
        bool preserve_permissions = true;
        bool preserve_times = true;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    /**
     * @brief Extracts a zstd-compressed tarball held in memory.
     *
     * Entries whose path escapes @p destination_root are skipped with a warning.
     * Errors: ErrorKind::Decode (not zstd), ErrorKind::ArchiveFormat (corrupt
     * container), ErrorKind::Extract (writing an accepted entry failed). Output
     * already written before a failure stays on disk.
     */
    Result Extract(std::span<const std::uint8_t> compressed,
                   const std::filesystem::path& destination_root) const;

  private:
    Options opt_{};
};

Result UnpackTarball(std::span<const std::uint8_t> compressed,
                     const std::filesystem::path& destination_root,
                     std::size_t strip_components);

} // namespace stash
