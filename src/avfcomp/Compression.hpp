#pragma once

#include "avfcomp/Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace avfcomp {

// SLLZ: a small dependency-free literal/LZ format, usable as a CVF backend when
// zlib output is not wanted.
//
// Frame:
//   "SLZ1"                     magic
//   u32 BE                     uncompressed size
//   commands until the end of the frame:
//     tag & 0x80 == 0   literal run of (tag + 1) bytes follows (1..128)
//     tag & 0x80 != 0   copy (tag & 0x7F) + 3 bytes (3..130) from
//                       `offset` bytes back; offset is u16 LE (1..65535).
//                       Source and destination may overlap.

inline constexpr std::uint8_t kSllzMagic[4] = {'S', 'L', 'Z', '1'};
inline constexpr std::size_t kSllzHeaderSize = 8;

bool HasSllzMagic(const std::uint8_t* data, std::size_t size);

void CompressSllz(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out);

// Errors are reported as BackendFailure.
bool DecompressSllz(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                    CodecError& outError);

} // namespace avfcomp
