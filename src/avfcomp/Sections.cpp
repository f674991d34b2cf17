#include "avfcomp/Sections.hpp"

#include <string>

namespace avfcomp {

namespace {

constexpr std::size_t kPresuffixLead = 2;
constexpr std::size_t kPresuffixTrail = 17;
const std::string kPresuffixMarker = "cs=";

} // namespace

bool ReadRecordHeader(ByteReader& in, ReplayRecord& record, CodecError& outError)
{
  if (!in.readU8(record.version, outError, "version")) return false;
  if (!in.readBytes(record.prefix.size(), record.prefix.data(), outError, "prefix")) return false;
  if (!in.readU8(record.level, outError, "level")) return false;

  if (!IsKnownLevel(record.level)) {
    return Fail(outError, ErrorCode::InvalidLevel, "unknown level byte " + std::to_string(record.level));
  }

  LevelStat stat;
  if (LookupLevelStat(record.level, stat)) {
    record.cols = stat.cols;
    record.rows = stat.rows;
    record.mineCount = stat.mines;
    return true;
  }

  std::uint8_t cols = 0;
  std::uint8_t rows = 0;
  std::uint16_t mines = 0;
  if (!in.readU8(cols, outError, "custom cols")) return false;
  if (!in.readU8(rows, outError, "custom rows")) return false;
  if (!in.readU16BE(mines, outError, "custom mine count")) return false;

  record.cols = static_cast<int>(cols) + 1;
  record.rows = static_cast<int>(rows) + 1;
  record.mineCount = static_cast<int>(mines);
  return true;
}

bool AppendRecordHeader(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError)
{
  if (!IsKnownLevel(record.level)) {
    return Fail(outError, ErrorCode::InvalidLevel, "unknown level byte " + std::to_string(record.level));
  }

  AppendU8(out, record.version);
  out.insert(out.end(), record.prefix.begin(), record.prefix.end());
  AppendU8(out, record.level);

  if (record.level != static_cast<std::uint8_t>(Level::Custom)) {
    LevelStat stat;
    (void)LookupLevelStat(record.level, stat);
    if (record.cols != stat.cols || record.rows != stat.rows || record.mineCount != stat.mines) {
      return Fail(outError, ErrorCode::InvalidLevel,
                  "board geometry does not match level " + std::to_string(record.level));
    }
    return true;
  }

  if (record.cols < 1 || record.cols > 256 || record.rows < 1 || record.rows > 256 || record.mineCount < 0 ||
      record.mineCount > 0xFFFF) {
    return Fail(outError, ErrorCode::InvalidLevel,
                "custom board " + std::to_string(record.cols) + "x" + std::to_string(record.rows) + " with " +
                    std::to_string(record.mineCount) + " mines cannot be stored");
  }
  AppendU8(out, static_cast<std::uint8_t>(record.cols - 1));
  AppendU8(out, static_cast<std::uint8_t>(record.rows - 1));
  AppendU16BE(out, static_cast<std::uint16_t>(record.mineCount));
  return true;
}

bool ReadInfoBlock(ByteReader& in, ReplayRecord& record, CodecError& outError)
{
  if (!ScanUntilByte(in, '[', record.prestamp, outError, "prestamp")) return false;
  return ScanUntilByte(in, ']', record.tsInfo, outError, "info block");
}

void AppendInfoBlock(const ReplayRecord& record, std::vector<std::uint8_t>& out)
{
  AppendBytes(out, record.prestamp);
  out.push_back('[');
  AppendBytes(out, record.tsInfo);
  out.push_back(']');
}

bool ReadPresuffixTail(ByteReader& in, ReplayRecord& record, CodecError& outError)
{
  // The marker search starts at the first of the two lead bytes, so a marker
  // overlapping them still counts.
  if (in.remaining() < kPresuffixLead) return in.truncated(outError, "presuffix");
  if (!ScanThroughMarker(in, kPresuffixMarker, record.presuffix, outError, "presuffix marker")) return false;
  return in.readBytes(kPresuffixTrail, record.presuffix, outError, "presuffix tail");
}

} // namespace avfcomp
