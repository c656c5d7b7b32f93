#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace stash {

// Lower-case hex digest, or an empty string if the digest could not be computed.
std::string Sha256Hex(std::span<const std::uint8_t> data);

// Compares the digest of `data` against `expected_hex` (either case) in constant time.
bool VerifySha256Hex(std::span<const std::uint8_t> data, std::string_view expected_hex);

} // namespace stash
