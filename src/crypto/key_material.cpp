#include "crypto/key_material.hpp"

#include "crypto/aead.hpp"
#include "util/hex.hpp"

#include <openssl/crypto.h>

#include <cctype>
#include <string>
#include <string_view>

namespace stash {

namespace {

bool IsSpace(std::uint8_t c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

} // namespace

Result ParseKeyMaterial(std::span<const std::uint8_t> raw, std::vector<std::uint8_t>& out_key) {
    SecureWipe(out_key);

    if (raw.size() == kAeadKeySize) {
        out_key.assign(raw.begin(), raw.end());
        return Result::Ok();
    }

    std::size_t begin = 0;
    std::size_t end = raw.size();
    while (begin < end && IsSpace(raw[begin])) ++begin;
    while (end > begin && IsSpace(raw[end - 1])) --end;

    if (end - begin == kAeadKeySize * 2) {
        const std::string_view hex(reinterpret_cast<const char*>(raw.data()) + begin, end - begin);
        std::vector<std::uint8_t> decoded;
        if (HexDecode(hex, decoded)) {
            out_key = std::move(decoded);
            return Result::Ok();
        }
    }

    return Result::Fail(ErrorKind::Key, "key must be " + std::to_string(kAeadKeySize) + " raw bytes or " +
                                            std::to_string(kAeadKeySize * 2) + " hex characters");
}

void SecureWipe(std::vector<std::uint8_t>& buf) {
    if (!buf.empty()) {
        OPENSSL_cleanse(buf.data(), buf.size());
    }
    buf.clear();
}

} // namespace stash
