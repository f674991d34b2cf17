#pragma once

#include "avfcomp/Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace avfcomp {

// 1-or-2 byte variable-length integers used for the event residual streams.
//
//   0xxxxxxx                      v < 0x80
//   1xxxxxxx xxxxxxxx             0x80 <= v < 0x8000 (high 7 bits first)
//
// Values >= 0x8000 are not representable.
inline constexpr std::uint32_t kVarintLimit = 0x8000u;

// Map signed deltas to non-negative integers: 0, -1, 1, -2, 2 -> 0, 1, 2, 3, 4.
inline constexpr std::uint32_t ZigZagEncode(std::int32_t n)
{
  return (static_cast<std::uint32_t>(n) << 1) ^ static_cast<std::uint32_t>(n >> 31);
}

inline constexpr std::int32_t ZigZagDecode(std::uint32_t z)
{
  return static_cast<std::int32_t>((z >> 1) ^ (~(z & 1u) + 1u));
}

// Append one value. Fails with ValueTooLarge when v >= 0x8000.
bool AppendVarint(std::vector<std::uint8_t>& out, std::uint32_t v, CodecError& outError);

// Encode a whole sequence.
bool EncodeVarints(const std::vector<std::uint32_t>& values, std::vector<std::uint8_t>& out, CodecError& outError);

// Decode `data[0..size)` completely. A 2-byte lead without its second byte is TruncatedBlock.
bool DecodeVarints(const std::uint8_t* data, std::size_t size, std::vector<std::uint32_t>& out,
                   CodecError& outError);

} // namespace avfcomp
