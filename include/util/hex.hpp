#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stash {

std::string HexEncode(std::span<const std::uint8_t> bytes);

// Decodes an even-length string of hex digits (either case). Returns false and
// leaves `out` empty on any malformed input.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>& out);

} // namespace stash
