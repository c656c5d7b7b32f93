#include "crypto/aead.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <memory>
#include <string>

namespace stash {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string OpenSslError(const char* what) {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return std::string(what) + " failed";
    char buf[256]{};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(what) + ": " + buf;
}

CipherCtxPtr NewGcmContext(bool encrypt,
                           std::span<const std::uint8_t> key,
                           const AeadNonce& nonce,
                           std::string& err) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        err = "EVP_CIPHER_CTX_new failed";
        return nullptr;
    }

    const int init = encrypt
        ? EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
        : EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
    if (init != 1) {
        err = OpenSslError("EVP_CipherInit_ex");
        return nullptr;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1) {
        err = OpenSslError("EVP_CTRL_GCM_SET_IVLEN");
        return nullptr;
    }

    const int keyed = encrypt
        ? EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data())
        : EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data());
    if (keyed != 1) {
        err = OpenSslError("EVP_CipherInit_ex key/iv");
        return nullptr;
    }
    return ctx;
}

} // namespace

Result AeadSeal(std::span<const std::uint8_t> plaintext,
                std::span<const std::uint8_t> key,
                const AeadNonce& nonce,
                std::vector<std::uint8_t>& out_blob) {
    out_blob.clear();
    if (key.size() != kAeadKeySize) {
        return Result::Fail(ErrorKind::Key, "AES-256-GCM key must be " + std::to_string(kAeadKeySize) +
                                                " bytes, got " + std::to_string(key.size()));
    }
    if (plaintext.size() > static_cast<std::size_t>(INT_MAX)) {
        return Result::Fail(ErrorKind::Crypto, "plaintext too large");
    }

    std::string err;
    CipherCtxPtr ctx = NewGcmContext(/*encrypt=*/true, key, nonce, err);
    if (!ctx) return Result::Fail(ErrorKind::Crypto, err);

    std::vector<std::uint8_t> blob(plaintext.size() + kAeadTagSize);
    int len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), blob.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            OPENSSL_cleanse(blob.data(), blob.size());
            return Result::Fail(ErrorKind::Crypto, OpenSslError("EVP_EncryptUpdate"));
        }
    }
    std::size_t produced = static_cast<std::size_t>(len);

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), blob.data() + produced, &final_len) != 1) {
        OPENSSL_cleanse(blob.data(), blob.size());
        return Result::Fail(ErrorKind::Crypto, OpenSslError("EVP_EncryptFinal_ex"));
    }
    produced += static_cast<std::size_t>(final_len);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAeadTagSize),
                            blob.data() + produced) != 1) {
        OPENSSL_cleanse(blob.data(), blob.size());
        return Result::Fail(ErrorKind::Crypto, OpenSslError("EVP_CTRL_GCM_GET_TAG"));
    }
    blob.resize(produced + kAeadTagSize);

    out_blob = std::move(blob);
    return Result::Ok();
}

std::optional<std::vector<std::uint8_t>> AeadOpen(std::span<const std::uint8_t> sealed_blob,
                                                  std::span<const std::uint8_t> key,
                                                  const AeadNonce& nonce) {
    if (key.size() != kAeadKeySize) return std::nullopt;
    if (sealed_blob.size() < kAeadTagSize) return std::nullopt;
    if (sealed_blob.size() - kAeadTagSize > static_cast<std::size_t>(INT_MAX)) return std::nullopt;

    const auto ciphertext = sealed_blob.first(sealed_blob.size() - kAeadTagSize);
    const auto tag = sealed_blob.last(kAeadTagSize);

    std::string err;
    CipherCtxPtr ctx = NewGcmContext(/*encrypt=*/false, key, nonce, err);
    if (!ctx) {
        ERR_clear_error();
        return std::nullopt;
    }

    // GCM is a stream mode: plaintext length equals ciphertext length. One
    // spare byte keeps data() valid for an empty payload.
    std::vector<std::uint8_t> plain(ciphertext.size() + 1);
    auto discard = [&]() -> std::optional<std::vector<std::uint8_t>> {
        OPENSSL_cleanse(plain.data(), plain.size());
        ERR_clear_error();
        return std::nullopt;
    };

    int len = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            return discard();
        }
    }
    std::size_t produced = static_cast<std::size_t>(len);

    std::array<std::uint8_t, kAeadTagSize> tag_copy{};
    std::copy(tag.begin(), tag.end(), tag_copy.begin());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_copy.size()),
                            tag_copy.data()) != 1) {
        return discard();
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + produced, &final_len) != 1) {
        return discard();
    }
    produced += static_cast<std::size_t>(final_len);

    plain.resize(produced);
    return plain;
}

Result GenerateNonce(AeadNonce& out) {
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        return Result::Fail(ErrorKind::Crypto, OpenSslError("RAND_bytes"));
    }
    return Result::Ok();
}

Result SealWithRandomNonce(std::span<const std::uint8_t> plaintext,
                           std::span<const std::uint8_t> key,
                           std::vector<std::uint8_t>& out_envelope) {
    out_envelope.clear();

    AeadNonce nonce{};
    auto r = GenerateNonce(nonce);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> blob;
    r = AeadSeal(plaintext, key, nonce, blob);
    if (!r.is_ok()) return r;

    out_envelope.reserve(nonce.size() + blob.size());
    out_envelope.insert(out_envelope.end(), nonce.begin(), nonce.end());
    out_envelope.insert(out_envelope.end(), blob.begin(), blob.end());
    return Result::Ok();
}

std::optional<std::vector<std::uint8_t>> OpenEnvelope(std::span<const std::uint8_t> envelope,
                                                      std::span<const std::uint8_t> key) {
    if (envelope.size() < kAeadNonceSize + kAeadTagSize) return std::nullopt;

    AeadNonce nonce{};
    std::copy_n(envelope.begin(), kAeadNonceSize, nonce.begin());
    return AeadOpen(envelope.subspan(kAeadNonceSize), key, nonce);
}

} // namespace stash
