#pragma once

#include <optional>
#include <string>
#include <vector>

namespace stash {

// A dependency specifier: name[extras] followed by either version
// constraints or a direct URL, and an optional environment marker.
struct Requirement {
    std::string name;
    std::vector<std::string> extras;
    std::vector<std::string> version_specifiers;
    std::optional<std::string> url;
    std::optional<std::string> marker;
};

// Canonical text form, e.g. "foo[a,b]>=1.0, <2.0 ; python_version < '3.8'" or
// "foo @ file:///${PROJECT_ROOT}/foo". Percent-encoded braces in the URL are
// restored so ${VAR} placeholders survive for later expansion. The URL wins
// over version specifiers when both are set.
std::string FormatRequirement(const Requirement& req);

} // namespace stash
