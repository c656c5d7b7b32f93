#include "archive/path_sanitizer.hpp"

#include <string>
#include <utility>
#include <vector>

namespace stash {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kRootComponent = "/";

// Splits a tar path into components. A leading '/' becomes a root component;
// empty and "." segments are dropped; ".." is kept for the prefix check.
std::vector<std::string_view> SplitComponents(std::string_view p) {
    std::vector<std::string_view> out;
    if (!p.empty() && p.front() == '/') {
        out.push_back(kRootComponent);
    }

    while (!p.empty()) {
        while (!p.empty() && p.front() == '/') p.remove_prefix(1);
        if (p.empty()) break;
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (seg != ".") out.push_back(seg);
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos);
    }
    return out;
}

fs::path Normalize(const fs::path& p) {
    fs::path n = p.lexically_normal();
    // "a/b/" normalizes to "a/b/" with an empty filename; drop it so prefix
    // comparison sees the same components for "a/b" and "a/b/".
    if (!n.empty() && !n.has_filename() && n != n.root_path()) {
        n = n.parent_path();
    }
    return n;
}

} // namespace

bool IsWithinRoot(const fs::path& root, const fs::path& candidate) {
    const fs::path r = Normalize(root);
    const fs::path c = Normalize(candidate);

    auto rit = r.begin();
    auto cit = c.begin();
    for (; rit != r.end(); ++rit, ++cit) {
        if (cit == c.end() || *cit != *rit) return false;
    }
    for (; cit != c.end(); ++cit) {
        if (*cit == "..") return false;
    }
    return true;
}

PathSanitizer::PathSanitizer(fs::path destination_root, std::size_t strip_components)
    : root_(Normalize(destination_root)), strip_components_(strip_components) {}

std::optional<fs::path> PathSanitizer::Sanitize(std::string_view raw_entry_path, Rejection* why) const {
    auto reject = [why](Rejection r) -> std::optional<fs::path> {
        if (why) *why = r;
        return std::nullopt;
    };

    if (raw_entry_path.find('\\') != std::string_view::npos) return reject(Rejection::InvalidCharacter);
    if (raw_entry_path.find('\0') != std::string_view::npos) return reject(Rejection::InvalidCharacter);

    const auto components = SplitComponents(raw_entry_path);
    if (components.size() <= strip_components_) return reject(Rejection::EmptyRemainder);

    fs::path remainder;
    for (std::size_t i = strip_components_; i < components.size(); ++i) {
        if (components[i] == kRootComponent) return reject(Rejection::AbsolutePath);
        remainder /= fs::path(std::string(components[i]));
    }
    if (remainder.empty()) return reject(Rejection::EmptyRemainder);

    fs::path target = Normalize(root_ / remainder);
    if (!IsWithinRoot(root_, target)) return reject(Rejection::OutsideRoot);
    return target;
}

const char* RejectionName(PathSanitizer::Rejection why) {
    switch (why) {
        case PathSanitizer::Rejection::EmptyRemainder:   return "nothing left after stripping";
        case PathSanitizer::Rejection::AbsolutePath:     return "absolute path";
        case PathSanitizer::Rejection::InvalidCharacter: return "invalid character";
        case PathSanitizer::Rejection::OutsideRoot:      return "escapes destination";
    }
    return "rejected";
}

std::optional<fs::path> SanitizeEntryPath(const fs::path& destination_root,
                                          std::string_view raw_entry_path,
                                          std::size_t strip_components) {
    return PathSanitizer(destination_root, strip_components).Sanitize(raw_entry_path);
}

} // namespace stash
