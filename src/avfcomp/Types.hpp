#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace avfcomp {

// Raw mouse action codes as they appear in the first byte of an AVF event record.
//
// Several codes decode to the same action (RightUpAlt, MiddleUpAlt, LeftUpAlt);
// they are kept distinct so the original byte is reproduced on write.
enum class MouseEventType : std::uint8_t {
  Move = 1,
  LeftDown = 3,
  LeftUp = 5,
  RightDown = 9,
  ShiftLeftDown = 11,
  RightUp = 17,
  LeftUpAlt = 21,
  MiddleDown = 33,
  MiddleUp = 65,
  RightUpAlt = 145,
  MiddleUpAlt = 193,
};

inline constexpr std::array<std::uint8_t, 11> kMouseEventCodes = {1, 3, 5, 9, 17, 33, 65, 145, 193, 11, 21};

inline constexpr bool IsKnownMouseEventType(std::uint8_t code)
{
  for (std::uint8_t c : kMouseEventCodes) {
    if (c == code) return true;
  }
  return false;
}

const char* MouseEventTypeName(MouseEventType t);

struct MouseEvent {
  MouseEventType type = MouseEventType::Move;

  // Milliseconds since the first click. AVF stores whole seconds plus hundredths,
  // so in practice this is always a multiple of 10.
  std::uint32_t gametime = 0;

  // Board-pixel coordinates.
  std::int32_t xpos = 0;
  std::int32_t ypos = 0;
};

inline bool operator==(const MouseEvent& a, const MouseEvent& b)
{
  return a.type == b.type && a.gametime == b.gametime && a.xpos == b.xpos && a.ypos == b.ypos;
}

inline bool operator!=(const MouseEvent& a, const MouseEvent& b) { return !(a == b); }

// 1-indexed (row, col).
using MinePos = std::pair<int, int>;

// Structured parts of the text footer. RealTime is derived on write and never stored.
struct ReplayFooter {
  std::string skin;
  std::string playerId;
  std::string arbiterVersion;
};

inline bool operator==(const ReplayFooter& a, const ReplayFooter& b)
{
  return a.skin == b.skin && a.playerId == b.playerId && a.arbiterVersion == b.arbiterVersion;
}

enum class Level : std::uint8_t {
  Beginner = 3,
  Intermediate = 4,
  Expert = 5,
  Custom = 6,
};

struct LevelStat {
  int cols = 0;
  int rows = 0;
  int mines = 0;
};

// Fixed board sizes for levels 3..5. Returns false for custom (6) and unknown levels.
bool LookupLevelStat(std::uint8_t level, LevelStat& out);

inline constexpr bool IsKnownLevel(std::uint8_t level) { return level >= 3 && level <= 6; }

// Everything needed to reproduce one AVF file byte-for-byte.
//
// The "opaque" spans are regions whose structure is not understood; they are
// copied verbatim in both directions and never interpreted.
struct ReplayRecord {
  std::uint8_t version = 0;
  std::array<std::uint8_t, 4> prefix{};
  std::uint8_t level = 0;

  int cols = 0;
  int rows = 0;
  int mineCount = 0;
  std::vector<MinePos> mines;

  std::vector<std::uint8_t> prestamp;
  // Content of the bracketed, pipe-delimited info block (brackets excluded).
  std::vector<std::uint8_t> tsInfo;
  std::vector<std::uint8_t> preevent;

  std::vector<MouseEvent> events;

  // Starts with the 8-byte terminating sentinel record.
  std::vector<std::uint8_t> presuffix;

  ReplayFooter footer;
};

} // namespace avfcomp
