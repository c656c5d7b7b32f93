#include "util/env_template.hpp"

#include <cstdlib>
#include <regex>

namespace stash {

namespace {

const std::regex& EnvVarPattern() {
    static const std::regex re(R"(\$\{([A-Z0-9_]+)\})");
    return re;
}

} // namespace

std::string ExpandEnvVars(std::string_view input, const EnvResolver& resolver) {
    std::string out;
    out.reserve(input.size());

    using Iter = std::string_view::const_iterator;
    std::regex_iterator<Iter> it(input.begin(), input.end(), EnvVarPattern());
    const std::regex_iterator<Iter> end;

    Iter copied = input.begin();
    for (; it != end; ++it) {
        const auto& m = *it;
        out.append(copied, m[0].first);
        if (resolver) {
            const std::string_view name(&*m[1].first, static_cast<size_t>(m[1].length()));
            if (auto value = resolver(name)) {
                out += *value;
            }
        }
        copied = m[0].second;
    }
    out.append(copied, input.end());
    return out;
}

std::string ExpandFromEnvironment(std::string_view input) {
    return ExpandEnvVars(input, [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    });
}

} // namespace stash
