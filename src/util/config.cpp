#include "util/config.hpp"

#include "util/config_json_utils.hpp"

namespace stash::config {

void StashConfigFromFile::Reset() {
    strip_components.reset();
    preserve_permissions.reset();
    preserve_times.reset();
    log_level.reset();
    key_file.reset();
}

Result StashConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }
    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, err + " in " + path);
    }
    return Result::Ok();
}

Result StashConfigFromFile::LoadString(const std::string& text, const std::string& origin) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(text, origin, json, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }
    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, err + " in " + origin);
    }
    return Result::Ok();
}

} // namespace stash::config
