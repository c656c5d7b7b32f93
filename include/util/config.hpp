#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace stash::config {

inline constexpr const char* kDefaultConfigPath = "/etc/stashkit/stashkit.conf";

// Settings read from the JSON config file. Unset fields fall back to the
// command line or built-in defaults.
struct StashConfigFromFile {
    std::optional<std::size_t> strip_components;
    std::optional<bool> preserve_permissions;
    std::optional<bool> preserve_times;
    std::optional<LogLevel> log_level;
    std::optional<std::string> key_file;

    void Reset();
    Result LoadFile(const std::string& path);
    Result LoadString(const std::string& text, const std::string& origin);
};

} // namespace stash::config
