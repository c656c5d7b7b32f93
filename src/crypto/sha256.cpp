#include "crypto/sha256.hpp"

#include "util/hex.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <array>
#include <optional>
#include <vector>

namespace stash {

namespace {

class EvpMdCtx final {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    ~EvpMdCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

using Sha256Digest = std::array<std::uint8_t, 32>;

std::optional<Sha256Digest> Digest(std::span<const std::uint8_t> data) {
    EvpMdCtx ctx;
    if (!ctx.ok() || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return std::nullopt;
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return std::nullopt;

    Sha256Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) return std::nullopt;
    return out;
}

} // namespace

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    auto digest = Digest(data);
    if (!digest) return {};
    return HexEncode(*digest);
}

bool VerifySha256Hex(std::span<const std::uint8_t> data, std::string_view expected_hex) {
    std::vector<std::uint8_t> expected;
    if (!HexDecode(expected_hex, expected) || expected.size() != 32) return false;

    auto digest = Digest(data);
    if (!digest) return false;
    return CRYPTO_memcmp(digest->data(), expected.data(), digest->size()) == 0;
}

} // namespace stash
