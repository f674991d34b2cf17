#pragma once

#include <cstddef>
#include <cstdint>

namespace avfcomp {

// Static dictionaries used by the CVF event block.
//
// Code space of one opcode byte:
//   0..240    compound vector codes (one byte stands for op + dt + dx + dy)
//   241..251  base opcodes (raw mouse code only; dt/dx/dy go to the residual streams)
//   252..254  unused
//   255       end of the opcode run

inline constexpr std::uint8_t kOpcodeSentinel = 0xFF;
inline constexpr std::size_t kCompoundVectorCount = 241;
inline constexpr std::size_t kBaseOpcodeCount = 11;
inline constexpr std::uint8_t kFirstBaseCode = 241;

// Key of the compound dictionary. dx/dy are zigzag-mapped deltas, dt is a
// delta in deciseconds.
struct CompoundVector {
  std::uint8_t op = 0;
  std::uint8_t dt = 0;
  std::uint8_t dx = 0;
  std::uint8_t dy = 0;
};

enum class OpcodeKind : std::uint8_t {
  Compound,
  Base,
  Sentinel,
  Unknown,
};

OpcodeKind ClassifyOpcode(std::uint8_t code);

// Raw mouse code -> base opcode (241..251).
bool EncodeBaseOpcode(std::uint8_t rawType, std::uint8_t& outCode);
// Base opcode -> raw mouse code.
bool DecodeBaseOpcode(std::uint8_t code, std::uint8_t& outRawType);

// Exact-match lookup of (op, dt, dx, dy) in the compound dictionary.
bool EncodeCompoundVector(std::uint8_t rawType, std::uint32_t dt, std::uint32_t dx, std::uint32_t dy,
                          std::uint8_t& outCode);
bool DecodeCompoundVector(std::uint8_t code, CompoundVector& out);

} // namespace avfcomp
