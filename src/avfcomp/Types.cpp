#include "avfcomp/Types.hpp"

namespace avfcomp {

namespace {

constexpr LevelStat kLevelStats[3] = {
  // cols, rows, mines
  {8, 8, 10},
  {16, 16, 40},
  {30, 16, 99},
};

} // namespace

const char* MouseEventTypeName(MouseEventType t)
{
  switch (t) {
  case MouseEventType::Move: return "move";
  case MouseEventType::LeftDown: return "lmb_down";
  case MouseEventType::LeftUp: return "lmb_up";
  case MouseEventType::RightDown: return "rmb_down";
  case MouseEventType::ShiftLeftDown: return "shift_lmb_down";
  case MouseEventType::RightUp: return "rmb_up";
  case MouseEventType::LeftUpAlt: return "lmb_up";
  case MouseEventType::MiddleDown: return "mmb_down";
  case MouseEventType::MiddleUp: return "mmb_up";
  case MouseEventType::RightUpAlt: return "rmb_up";
  case MouseEventType::MiddleUpAlt: return "mmb_up";
  }
  return "unknown";
}

bool LookupLevelStat(std::uint8_t level, LevelStat& out)
{
  if (level < 3 || level > 5) return false;
  out = kLevelStats[level - 3];
  return true;
}

} // namespace avfcomp
