#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace stash {

// Accepts either exactly kAeadKeySize raw bytes, or their hex form optionally
// surrounded by ASCII whitespace (as written by `xxd -p -c 64`).
Result ParseKeyMaterial(std::span<const std::uint8_t> raw, std::vector<std::uint8_t>& out_key);

// Overwrites the buffer with zeros in a way the compiler cannot elide, then clears it.
void SecureWipe(std::vector<std::uint8_t>& buf);

} // namespace stash
