#pragma once

#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace stash {

// AES-256-GCM with empty associated data.
inline constexpr std::size_t kAeadKeySize = 32;
inline constexpr std::size_t kAeadNonceSize = 12;
inline constexpr std::size_t kAeadTagSize = 16;

using AeadNonce = std::array<std::uint8_t, kAeadNonceSize>;

// Encrypts `plaintext` and writes ciphertext || tag to `out_blob`.
// A nonce must never be used twice with the same key; callers track that.
// Errors: ErrorKind::Key for a key that is not kAeadKeySize bytes,
// ErrorKind::Crypto for a cipher failure.
Result AeadSeal(std::span<const std::uint8_t> plaintext,
                std::span<const std::uint8_t> key,
                const AeadNonce& nonce,
                std::vector<std::uint8_t>& out_blob);

// Verifies and decrypts ciphertext || tag. Every failure (bad tag, short blob,
// bad key) yields std::nullopt with no further detail.
std::optional<std::vector<std::uint8_t>> AeadOpen(std::span<const std::uint8_t> sealed_blob,
                                                  std::span<const std::uint8_t> key,
                                                  const AeadNonce& nonce);

Result GenerateNonce(AeadNonce& out);

// Envelope form: nonce || ciphertext || tag, with a fresh random nonce.
Result SealWithRandomNonce(std::span<const std::uint8_t> plaintext,
                           std::span<const std::uint8_t> key,
                           std::vector<std::uint8_t>& out_envelope);

std::optional<std::vector<std::uint8_t>> OpenEnvelope(std::span<const std::uint8_t> envelope,
                                                      std::span<const std::uint8_t> key);

} // namespace stash
