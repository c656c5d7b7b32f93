#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace stash {

using EnvResolver = std::function<std::optional<std::string>(std::string_view name)>;

// Replaces each ${NAME} (NAME in [A-Z0-9_]+) with resolver(NAME), or with
// nothing when the resolver has no value. Other text is copied unchanged.
std::string ExpandEnvVars(std::string_view input, const EnvResolver& resolver);

// ExpandEnvVars() resolving names from the process environment.
std::string ExpandFromEnvironment(std::string_view input);

} // namespace stash
