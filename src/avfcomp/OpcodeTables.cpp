#include "avfcomp/OpcodeTables.hpp"

#include "avfcomp/Types.hpp"

#include <array>

namespace avfcomp {

namespace {

struct BaseOpcode {
  std::uint8_t raw;
  std::uint8_t code;
};

constexpr BaseOpcode kBaseOpcodes[kBaseOpcodeCount] = {
  {1, 241}, {3, 242}, {5, 243}, {9, 244}, {17, 245}, {33, 246},
  {65, 247}, {145, 248}, {193, 249}, {11, 250}, {21, 251},
};

// Indexed by code. Ordered roughly by frequency in real replays.
constexpr CompoundVector kCompoundVectors[kCompoundVectorCount] = {
  {1, 0, 2, 0}, {1, 0, 0, 2}, {1, 0, 1, 0}, {1, 0, 0, 0}, {1, 0, 0, 1}, {1, 1, 0, 2},  // 0
  {1, 1, 2, 0}, {1, 1, 0, 1}, {1, 1, 1, 0}, {1, 1, 0, 0}, {1, 0, 1, 2}, {1, 0, 2, 1},  // 6
  {1, 0, 1, 1}, {1, 0, 2, 2}, {3, 0, 0, 0}, {5, 0, 0, 0}, {1, 2, 0, 2}, {1, 1, 1, 2},  // 12
  {1, 1, 2, 2}, {1, 1, 2, 1}, {1, 2, 2, 0}, {1, 1, 1, 1}, {1, 0, 4, 0}, {3, 1, 0, 0},  // 18
  {5, 1, 0, 0}, {1, 2, 0, 1}, {1, 2, 1, 0}, {17, 0, 0, 0}, {9, 0, 0, 0}, {1, 2, 0, 0},  // 24
  {1, 0, 3, 0}, {1, 0, 0, 4}, {1, 1, 4, 0}, {1, 0, 0, 3}, {1, 3, 0, 2}, {9, 1, 0, 0},  // 30
  {1, 1, 0, 4}, {1, 3, 2, 0}, {5, 2, 0, 0}, {1, 0, 6, 0}, {1, 1, 3, 0}, {1, 0, 3, 2},  // 36
  {3, 2, 0, 0}, {1, 0, 4, 1}, {17, 1, 0, 0}, {1, 1, 0, 3}, {1, 3, 1, 0}, {1, 0, 4, 2},  // 42
  {1, 3, 0, 1}, {1, 0, 1, 4}, {1, 4, 0, 2}, {5, 3, 0, 0}, {1, 4, 2, 0}, {1, 0, 3, 1},  // 48
  {5, 4, 0, 0}, {1, 0, 2, 3}, {1, 0, 1, 3}, {5, 5, 0, 0}, {1, 0, 2, 4}, {1, 4, 1, 0},  // 54
  {1, 3, 0, 0}, {1, 2, 2, 2}, {9, 2, 0, 0}, {1, 1, 3, 2}, {1, 0, 3, 4}, {5, 6, 0, 0},  // 60
  {1, 4, 0, 1}, {1, 2, 1, 2}, {3, 3, 0, 0}, {1, 1, 4, 2}, {1, 1, 1, 4}, {1, 2, 0, 4},  // 66
  {1, 1, 4, 1}, {1, 1, 2, 3}, {1, 1, 6, 0}, {1, 5, 0, 2}, {1, 2, 2, 1}, {1, 5, 2, 0},  // 72
  {1, 1, 3, 1}, {1, 1, 2, 4}, {1, 1, 1, 3}, {1, 2, 1, 1}, {5, 7, 0, 0}, {1, 2, 4, 0},  // 78
  {1, 5, 1, 0}, {1, 0, 5, 4}, {1, 6, 0, 2}, {1, 5, 0, 1}, {3, 4, 0, 0}, {1, 0, 5, 0},  // 84
  {1, 2, 0, 3}, {1, 2, 3, 0}, {1, 6, 2, 0}, {1, 4, 0, 0}, {1, 0, 6, 2}, {5, 8, 0, 0},  // 90
  {1, 0, 5, 2}, {9, 3, 0, 0}, {1, 0, 6, 1}, {1, 0, 8, 0}, {1, 0, 0, 6}, {1, 6, 1, 0},  // 96
  {1, 1, 0, 6}, {1, 1, 3, 4}, {17, 2, 0, 0}, {1, 1, 5, 0}, {1, 6, 0, 1}, {1, 1, 0, 5},  // 102
  {1, 0, 4, 3}, {1, 7, 0, 2}, {1, 1, 4, 3}, {1, 5, 0, 0}, {1, 0, 0, 5}, {1, 0, 4, 4},  // 108
  {1, 2, 6, 0}, {1, 0, 3, 3}, {9, 4, 0, 0}, {1, 7, 2, 0}, {1, 2, 2, 4}, {1, 2, 0, 6},  // 114
  {1, 7, 1, 0}, {1, 1, 6, 2}, {1, 1, 5, 2}, {1, 1, 4, 4}, {1, 2, 1, 4}, {1, 2, 4, 2},  // 120
  {1, 1, 6, 1}, {1, 1, 3, 3}, {1, 2, 3, 2}, {3, 5, 0, 0}, {1, 1, 5, 4}, {1, 7, 0, 1},  // 126
  {1, 2, 2, 3}, {1, 1, 8, 0}, {1, 6, 0, 0}, {1, 2, 5, 0}, {1, 2, 0, 5}, {1, 2, 4, 1},  // 132
  {1, 1, 2, 5}, {1, 2, 1, 3}, {1, 2, 3, 1}, {5, 9, 0, 0}, {1, 8, 0, 2}, {1, 0, 5, 1},  // 138
  {1, 0, 1, 6}, {1, 1, 1, 6}, {1, 8, 1, 0}, {1, 8, 2, 0}, {17, 3, 0, 0}, {1, 1, 2, 6},  // 144
  {1, 1, 1, 5}, {1, 1, 5, 1}, {1, 0, 2, 6}, {1, 0, 1, 5}, {17, 4, 0, 0}, {1, 0, 3, 6},  // 150
  {1, 0, 2, 5}, {1, 8, 0, 1}, {3, 6, 0, 0}, {1, 7, 0, 0}, {1, 3, 2, 2}, {1, 0, 10, 0},  // 156
  {1, 2, 3, 4}, {17, 5, 0, 0}, {17, 6, 0, 0}, {1, 0, 8, 1}, {1, 1, 4, 5}, {1, 0, 5, 6},  // 162
  {1, 0, 6, 3}, {1, 3, 1, 2}, {1, 1, 3, 6}, {1, 0, 8, 2}, {1, 2, 4, 3}, {1, 1, 0, 8},  // 168
  {1, 2, 8, 0}, {1, 2, 4, 4}, {1, 2, 3, 3}, {1, 0, 7, 0}, {1, 2, 2, 6}, {1, 2, 2, 5},  // 174
  {9, 5, 0, 0}, {1, 1, 7, 0}, {1, 2, 5, 2}, {1, 9, 0, 2}, {1, 3, 2, 1}, {1, 2, 6, 2},  // 180
  {1, 0, 7, 4}, {1, 1, 6, 3}, {17, 7, 0, 0}, {1, 2, 1, 6}, {1, 1, 0, 7}, {1, 9, 1, 0},  // 186
  {1, 0, 5, 3}, {5, 10, 0, 0}, {1, 2, 6, 1}, {1, 1, 5, 3}, {1, 2, 5, 1}, {1, 1, 3, 5},  // 192
  {1, 0, 7, 2}, {1, 1, 6, 4}, {1, 0, 6, 4}, {1, 2, 1, 5}, {1, 9, 2, 0}, {1, 1, 10, 0},  // 198
  {1, 3, 1, 1}, {1, 0, 0, 8}, {17, 8, 0, 0}, {1, 8, 0, 0}, {1, 1, 4, 6}, {1, 0, 4, 5},  // 204
  {1, 9, 0, 1}, {1, 2, 7, 0}, {1, 1, 8, 1}, {3, 7, 0, 0}, {1, 0, 3, 5}, {1, 1, 5, 6},  // 210
  {1, 2, 0, 7}, {1, 2, 0, 8}, {1, 1, 8, 2}, {1, 2, 5, 4}, {1, 1, 7, 2}, {9, 6, 0, 0},  // 216
  {1, 2, 4, 5}, {1, 3, 0, 4}, {1, 0, 0, 7}, {1, 2, 3, 6}, {1, 10, 0, 2}, {1, 4, 2, 2},  // 222
  {1, 2, 3, 5}, {1, 2, 5, 3}, {65, 0, 0, 0}, {1, 2, 6, 3}, {33, 0, 0, 0}, {1, 0, 4, 6},  // 228
  {1, 1, 1, 8}, {1, 0, 12, 0}, {1, 1, 6, 5}, {1, 2, 6, 4}, {1, 1, 2, 7}, {1, 2, 4, 6},  // 234
  {1, 1, 7, 1},  // 240
};

constexpr std::array<std::uint8_t, 256> BuildBaseDecodeTable()
{
  std::array<std::uint8_t, 256> t{};
  for (const BaseOpcode& b : kBaseOpcodes) {
    t[b.code] = b.raw;
  }
  return t;
}

constexpr std::array<std::uint8_t, 256> kBaseDecode = BuildBaseDecodeTable();

constexpr bool BaseCodesAreDisjoint()
{
  for (const BaseOpcode& b : kBaseOpcodes) {
    if (b.code < kCompoundVectorCount || b.code == kOpcodeSentinel) return false;
    if (!IsKnownMouseEventType(b.raw)) return false;
  }
  for (std::size_t i = 0; i < kBaseOpcodeCount; ++i) {
    for (std::size_t j = i + 1; j < kBaseOpcodeCount; ++j) {
      if (kBaseOpcodes[i].code == kBaseOpcodes[j].code || kBaseOpcodes[i].raw == kBaseOpcodes[j].raw) return false;
    }
  }
  return true;
}

constexpr bool CompoundOpsAreKnown()
{
  for (const CompoundVector& v : kCompoundVectors) {
    if (!IsKnownMouseEventType(v.op)) return false;
  }
  return true;
}

static_assert(kFirstBaseCode == kCompoundVectorCount, "base opcodes must follow the compound codes");
static_assert(BaseCodesAreDisjoint(), "base opcode codes overlap the compound range or the sentinel");
static_assert(CompoundOpsAreKnown(), "compound dictionary references an unknown mouse code");

// Dense forward index for the compound dictionary:
//   slot(op) * 16^3 + dt * 16^2 + dx * 16 + dy
// Every key component in the table is < 16.
constexpr std::uint32_t kAxis = 16;
constexpr std::uint8_t kMiss = 0xFF;

int OpSlot(std::uint8_t raw)
{
  for (std::size_t i = 0; i < kBaseOpcodeCount; ++i) {
    if (kBaseOpcodes[i].raw == raw) return static_cast<int>(i);
  }
  return -1;
}

const std::array<std::uint8_t, kBaseOpcodeCount * kAxis * kAxis * kAxis>& CompoundIndex()
{
  static const auto index = [] {
    std::array<std::uint8_t, kBaseOpcodeCount * kAxis * kAxis * kAxis> t{};
    t.fill(kMiss);
    for (std::size_t code = 0; code < kCompoundVectorCount; ++code) {
      const CompoundVector& v = kCompoundVectors[code];
      const std::size_t slot = static_cast<std::size_t>(OpSlot(v.op));
      const std::size_t i = ((slot * kAxis + v.dt) * kAxis + v.dx) * kAxis + v.dy;
      t[i] = static_cast<std::uint8_t>(code);
    }
    return t;
  }();
  return index;
}

} // namespace

OpcodeKind ClassifyOpcode(std::uint8_t code)
{
  if (code < kCompoundVectorCount) return OpcodeKind::Compound;
  if (code == kOpcodeSentinel) return OpcodeKind::Sentinel;
  if (kBaseDecode[code] != 0) return OpcodeKind::Base;
  return OpcodeKind::Unknown;
}

bool EncodeBaseOpcode(std::uint8_t rawType, std::uint8_t& outCode)
{
  for (const BaseOpcode& b : kBaseOpcodes) {
    if (b.raw == rawType) {
      outCode = b.code;
      return true;
    }
  }
  return false;
}

bool DecodeBaseOpcode(std::uint8_t code, std::uint8_t& outRawType)
{
  const std::uint8_t raw = kBaseDecode[code];
  if (raw == 0) return false;
  outRawType = raw;
  return true;
}

bool EncodeCompoundVector(std::uint8_t rawType, std::uint32_t dt, std::uint32_t dx, std::uint32_t dy,
                          std::uint8_t& outCode)
{
  if (dt >= kAxis || dx >= kAxis || dy >= kAxis) return false;
  const int slot = OpSlot(rawType);
  if (slot < 0) return false;

  const std::size_t i = ((static_cast<std::size_t>(slot) * kAxis + dt) * kAxis + dx) * kAxis + dy;
  const std::uint8_t code = CompoundIndex()[i];
  if (code == kMiss) return false;
  outCode = code;
  return true;
}

bool DecodeCompoundVector(std::uint8_t code, CompoundVector& out)
{
  if (code >= kCompoundVectorCount) return false;
  out = kCompoundVectors[code];
  return true;
}

} // namespace avfcomp
