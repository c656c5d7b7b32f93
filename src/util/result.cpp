#include "util/result.hpp"

namespace stash {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "ok";
        case ErrorKind::Decode:        return "decode error";
        case ErrorKind::ArchiveFormat: return "archive format error";
        case ErrorKind::Extract:       return "extract error";
        case ErrorKind::Key:           return "key error";
        case ErrorKind::Crypto:        return "crypto error";
        case ErrorKind::Io:            return "I/O error";
        case ErrorKind::Config:        return "config error";
    }
    return "error";
}

} // namespace stash
