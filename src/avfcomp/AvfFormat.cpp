#include "avfcomp/AvfFormat.hpp"

#include "avfcomp/ByteCursor.hpp"
#include "avfcomp/FileIO.hpp"
#include "avfcomp/Footer.hpp"
#include "avfcomp/Sections.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace avfcomp {

namespace {

// After the event-start scan the cursor sits just past sec_lo of the first
// event record: mouse, x_hi, sec_lo. Those three bytes are re-read as part of
// the record, and the first two were also collected into the scan buffer.
constexpr std::size_t kEventStartOvershoot = 3;
constexpr std::size_t kEventStartCollected = 2;

bool ReadMines(ByteReader& in, ReplayRecord& record, CodecError& outError)
{
  record.mines.clear();
  record.mines.reserve(static_cast<std::size_t>(record.mineCount));
  for (int i = 0; i < record.mineCount; ++i) {
    std::uint8_t row = 0;
    std::uint8_t col = 0;
    if (!in.readU8(row, outError, "mine row")) return false;
    if (!in.readU8(col, outError, "mine col")) return false;
    record.mines.emplace_back(row, col);
  }
  return true;
}

bool ReadPreevent(ByteReader& in, ReplayRecord& record, CodecError& outError)
{
  std::vector<std::uint8_t> scanned;
  if (!ScanEventStart(in, scanned, outError)) return false;
  if (scanned.size() < kEventStartCollected) {
    return Fail(outError, ErrorCode::Truncated, "event stream starts before the end of the info block");
  }

  record.preevent.assign(scanned.begin(), scanned.end() - static_cast<std::ptrdiff_t>(kEventStartCollected));
  return in.seekBack(kEventStartOvershoot, outError);
}

bool ReadEvents(ByteReader& in, ReplayRecord& record, CodecError& outError)
{
  record.events.clear();

  std::uint8_t rec[kAvfEventRecordSize];
  while (true) {
    if (!in.readBytes(kAvfEventRecordSize, rec, outError, "event record")) return false;

    if (IsAvfSentinelRecord(rec)) {
      record.presuffix.assign(rec, rec + kAvfEventRecordSize);
      return true;
    }

    const std::uint8_t mouse = rec[0];
    if (!IsKnownMouseEventType(mouse)) {
      return Fail(outError, ErrorCode::UnknownEventType,
                  "unknown mouse code " + std::to_string(mouse) + " in event " +
                      std::to_string(record.events.size()));
    }

    const std::uint32_t sec = ((static_cast<std::uint32_t>(rec[6]) << 8) | rec[2]) - 1u;
    MouseEvent e;
    e.type = static_cast<MouseEventType>(mouse);
    e.gametime = 1000u * sec + 10u * rec[4];
    e.xpos = (static_cast<std::int32_t>(rec[1]) << 8) | rec[3];
    e.ypos = (static_cast<std::int32_t>(rec[5]) << 8) | rec[7];
    record.events.push_back(e);
  }
}

// The structured footer drops RealTime and the fixed banner text, so it is
// only accepted when writing it back reproduces the stored bytes.
bool CheckFooterRebuilds(const ReplayRecord& record, const std::vector<std::uint8_t>& raw, CodecError& outError)
{
  std::vector<std::uint8_t> rebuilt;
  if (!AppendAvfFooter(record, rebuilt, outError)) return false;
  if (rebuilt == raw) return true;

  std::size_t i = 0;
  while (i < raw.size() && i < rebuilt.size() && raw[i] == rebuilt[i]) ++i;
  return Fail(outError, ErrorCode::MalformedFooter,
              "footer cannot be rebuilt from its fields (differs at footer byte " + std::to_string(i) + ")");
}

bool CheckEventRange(const MouseEvent& e, std::size_t index, CodecError& outError)
{
  if (e.gametime / 1000u + 1u > 0xFFFFu || e.xpos < 0 || e.xpos > 0xFFFF || e.ypos < 0 || e.ypos > 0xFFFF) {
    return Fail(outError, ErrorCode::ValueTooLarge,
                "event " + std::to_string(index) + " does not fit the 8-byte AVF record");
  }
  return true;
}

} // namespace

void EncodeAvfEvent(const MouseEvent& e, std::uint8_t out[kAvfEventRecordSize])
{
  const std::uint32_t sec = e.gametime / 1000u + 1u;
  const std::uint32_t hun = (e.gametime % 1000u) / 10u;
  const std::uint32_t x = static_cast<std::uint32_t>(e.xpos);
  const std::uint32_t y = static_cast<std::uint32_t>(e.ypos);

  out[0] = static_cast<std::uint8_t>(e.type);
  out[1] = static_cast<std::uint8_t>((x >> 8) & 0xFFu);
  out[2] = static_cast<std::uint8_t>(sec & 0xFFu);
  out[3] = static_cast<std::uint8_t>(x & 0xFFu);
  out[4] = static_cast<std::uint8_t>(hun);
  out[5] = static_cast<std::uint8_t>((y >> 8) & 0xFFu);
  out[6] = static_cast<std::uint8_t>((sec >> 8) & 0xFFu);
  out[7] = static_cast<std::uint8_t>(y & 0xFFu);
}

bool IsAvfSentinelRecord(const std::uint8_t rec[kAvfEventRecordSize])
{
  return rec[2] == 0u && rec[6] == 0u;
}

bool ParseAvf(const std::uint8_t* data, std::size_t size, ReplayRecord& outRecord, CodecError& outError)
{
  outError.clear();
  outRecord = {};

  ByteReader in(data, size, ErrorCode::Truncated);
  if (!ReadRecordHeader(in, outRecord, outError)) return false;
  if (!ReadMines(in, outRecord, outError)) return false;
  if (!ReadInfoBlock(in, outRecord, outError)) return false;
  if (!ReadPreevent(in, outRecord, outError)) return false;
  if (!ReadEvents(in, outRecord, outError)) return false;
  if (!ReadPresuffixTail(in, outRecord, outError)) return false;

  std::vector<std::uint8_t> footer;
  in.readRest(footer);
  if (!ParseAvfFooter(footer, outRecord.footer, outError)) return false;
  return CheckFooterRebuilds(outRecord, footer, outError);
}

bool ParseAvf(const std::vector<std::uint8_t>& bytes, ReplayRecord& outRecord, CodecError& outError)
{
  return ParseAvf(bytes.data(), bytes.size(), outRecord, outError);
}

bool WriteAvf(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError)
{
  outError.clear();

  std::vector<std::uint8_t> buf;
  buf.reserve(256 + record.events.size() * kAvfEventRecordSize);

  if (!AppendRecordHeader(record, buf, outError)) return false;

  if (record.mines.size() != static_cast<std::size_t>(record.mineCount)) {
    return Fail(outError, ErrorCode::InvalidLevel,
                "record holds " + std::to_string(record.mines.size()) + " mines but declares " +
                    std::to_string(record.mineCount));
  }
  for (const MinePos& m : record.mines) {
    if (m.first < 0 || m.first > 0xFF || m.second < 0 || m.second > 0xFF) {
      return Fail(outError, ErrorCode::InvalidLevel,
                  "mine (" + std::to_string(m.first) + ", " + std::to_string(m.second) + ") does not fit a byte");
    }
    AppendU8(buf, static_cast<std::uint8_t>(m.first));
    AppendU8(buf, static_cast<std::uint8_t>(m.second));
  }

  AppendInfoBlock(record, buf);
  AppendBytes(buf, record.preevent);

  std::uint8_t rec[kAvfEventRecordSize];
  for (std::size_t i = 0; i < record.events.size(); ++i) {
    if (!CheckEventRange(record.events[i], i, outError)) return false;
    EncodeAvfEvent(record.events[i], rec);
    buf.insert(buf.end(), rec, rec + kAvfEventRecordSize);
  }

  AppendBytes(buf, record.presuffix);
  if (!AppendAvfFooter(record, buf, outError)) return false;

  out.insert(out.end(), buf.begin(), buf.end());
  return true;
}

bool ParseAvf(std::istream& in, ReplayRecord& outRecord, CodecError& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!ReadStreamBytes(in, bytes, outError)) return false;
  return ParseAvf(bytes, outRecord, outError);
}

bool WriteAvf(const ReplayRecord& record, std::ostream& out, CodecError& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!WriteAvf(record, bytes, outError)) return false;
  return WriteStreamBytes(out, bytes, outError);
}

} // namespace avfcomp
