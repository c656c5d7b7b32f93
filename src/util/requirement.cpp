#include "util/requirement.hpp"

#include <string_view>

namespace stash {

namespace {

std::string Join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string RestoreBraces(std::string_view url) {
    std::string out;
    out.reserve(url.size());
    for (size_t i = 0; i < url.size(); ++i) {
        if (url[i] == '%' && i + 2 < url.size() && url[i + 1] == '7') {
            const char c = url[i + 2];
            if (c == 'B' || c == 'b') {
                out.push_back('{');
                i += 2;
                continue;
            }
            if (c == 'D' || c == 'd') {
                out.push_back('}');
                i += 2;
                continue;
            }
        }
        out.push_back(url[i]);
    }
    return out;
}

} // namespace

std::string FormatRequirement(const Requirement& req) {
    std::string out = req.name;
    if (!req.extras.empty()) {
        out += "[" + Join(req.extras, ",") + "]";
    }
    if (req.url) {
        out += " @ " + RestoreBraces(*req.url);
    } else if (!req.version_specifiers.empty()) {
        out += Join(req.version_specifiers, ", ");
    }
    if (req.marker) {
        out += " ; " + *req.marker;
    }
    return out;
}

} // namespace stash
