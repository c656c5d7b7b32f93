#include "util/config_json_utils.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace stash::config::detail {

namespace {

// Each getter returns false only for a present key of the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<long long>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<long long>());
        return true;
    }
    err = std::string(key) + " must be a non-negative integer";
    return false;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool ParseJsonObject(const std::string& text, const std::string& origin, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + origin + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + origin;
        return false;
    }
    return true;
}

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    std::ostringstream ss;
    ss << is.rdbuf();
    return ParseJsonObject(ss.str(), path, out, err);
}

bool FillConfigFromJson(const nlohmann::json& j, StashConfigFromFile& cfg, std::string& err) {
    {
        std::optional<std::uint64_t> v;
        if (!GetU64IfPresent(j, "StripComponents", v, err)) return false;
        if (v) cfg.strip_components = static_cast<std::size_t>(*v);
    }
    if (!GetBoolIfPresent(j, "PreservePermissions", cfg.preserve_permissions, err)) return false;
    if (!GetBoolIfPresent(j, "PreserveTimes", cfg.preserve_times, err)) return false;
    if (!GetStringIfPresent(j, "KeyFile", cfg.key_file, err)) return false;
    if (cfg.key_file && cfg.key_file->empty()) {
        err = "KeyFile must not be empty";
        return false;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level, err)) return false;
    if (level) {
        cfg.log_level = ParseLogLevel(*level);
        if (!cfg.log_level) {
            err = "unknown LogLevel: " + *level;
            return false;
        }
    }

    return true;
}

} // namespace stash::config::detail
