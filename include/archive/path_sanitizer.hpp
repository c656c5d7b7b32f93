#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

namespace stash {

// Maps archive entry paths onto a destination root. An entry is accepted only
// when its stripped remainder is non-empty, relative, and still lies on or
// under the root after lexical normalization.
class PathSanitizer {
  public:
    enum class Rejection {
        EmptyRemainder,
        AbsolutePath,
        InvalidCharacter,
        OutsideRoot,
    };

    PathSanitizer(std::filesystem::path destination_root, std::size_t strip_components);

    std::optional<std::filesystem::path> Sanitize(std::string_view raw_entry_path,
                                                  Rejection* why = nullptr) const;

    const std::filesystem::path& Root() const { return root_; }
    std::size_t StripComponents() const { return strip_components_; }

  private:
    std::filesystem::path root_;
    std::size_t strip_components_ = 0;
};

const char* RejectionName(PathSanitizer::Rejection why);

// Convenience wrapper around PathSanitizer for one-off checks.
std::optional<std::filesystem::path> SanitizeEntryPath(const std::filesystem::path& destination_root,
                                                       std::string_view raw_entry_path,
                                                       std::size_t strip_components);

// True when `candidate` equals `root` or is nested under it. Both paths are
// compared component-wise after lexical normalization.
bool IsWithinRoot(const std::filesystem::path& root, const std::filesystem::path& candidate);

} // namespace stash
