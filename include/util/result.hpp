#pragma once
#include <string>
#include <utility>

namespace stash {

enum class ErrorKind : int {
    None = 0,
    Decode,
    ArchiveFormat,
    Extract,
    Key,
    Crypto,
    Io,
    Config,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .err = 0, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace stash
