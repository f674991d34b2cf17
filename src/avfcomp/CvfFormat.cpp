#include "avfcomp/CvfFormat.hpp"

#include "avfcomp/AvfFormat.hpp"
#include "avfcomp/ByteCursor.hpp"
#include "avfcomp/FileIO.hpp"
#include "avfcomp/Footer.hpp"
#include "avfcomp/MineField.hpp"
#include "avfcomp/Sections.hpp"

#include <istream>
#include <ostream>
#include <utility>

namespace avfcomp {

namespace {

constexpr std::uint8_t kEventMarker[2] = {0x00, 0x01};

} // namespace

bool WriteCvf(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError,
              EventBlockStats* outStats)
{
  outError.clear();

  std::vector<std::uint8_t> buf;
  buf.reserve(256 + record.events.size() * 2);

  if (!AppendRecordHeader(record, buf, outError)) return false;
  if (!EncodeMineBitmap(record.mines, record.rows, record.cols, buf, outError)) return false;
  AppendInfoBlock(record, buf);
  AppendBytes(buf, record.preevent);
  buf.insert(buf.end(), kEventMarker, kEventMarker + 2);
  if (!WriteEventBlock(record.events, buf, outError, outStats)) return false;
  AppendBytes(buf, record.presuffix);
  AppendCvfFooter(record.footer, buf);

  out.insert(out.end(), buf.begin(), buf.end());
  return true;
}

bool ReadCvf(const std::uint8_t* data, std::size_t size, ReplayRecord& outRecord, CodecError& outError,
             EventBlockStats* outStats)
{
  outError.clear();
  outRecord = {};

  ByteReader in(data, size, ErrorCode::TruncatedBlock);
  if (!ReadRecordHeader(in, outRecord, outError)) return false;

  const std::size_t bitmapSize = MineBitmapSize(outRecord.rows, outRecord.cols);
  if (in.remaining() < bitmapSize) return in.truncated(outError, "mine bitmap");
  DecodeMineBitmap(in.data() + in.position(), outRecord.rows, outRecord.cols, outRecord.mines);
  if (!in.skip(bitmapSize, outError, "mine bitmap")) return false;

  if (!ReadInfoBlock(in, outRecord, outError)) return false;

  // The scan stops on the marker's 0x01; the collected bytes end with its 0x00.
  std::vector<std::uint8_t> scanned;
  if (!ScanEventStart(in, scanned, outError)) return false;
  scanned.pop_back();
  outRecord.preevent = std::move(scanned);

  if (!ReadEventBlock(in, outRecord.events, outError, outStats)) return false;

  if (!in.readBytes(kAvfEventRecordSize, outRecord.presuffix, outError, "sentinel record")) return false;
  if (!ReadPresuffixTail(in, outRecord, outError)) return false;

  std::vector<std::uint8_t> footer;
  in.readRest(footer);
  return ParseCvfFooter(footer, outRecord.footer, outError);
}

bool ReadCvf(const std::vector<std::uint8_t>& bytes, ReplayRecord& outRecord, CodecError& outError,
             EventBlockStats* outStats)
{
  return ReadCvf(bytes.data(), bytes.size(), outRecord, outError, outStats);
}

bool WriteCvf(const ReplayRecord& record, std::ostream& out, CodecError& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!WriteCvf(record, bytes, outError)) return false;
  return WriteStreamBytes(out, bytes, outError);
}

bool ReadCvf(std::istream& in, ReplayRecord& outRecord, CodecError& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!ReadStreamBytes(in, bytes, outError)) return false;
  return ReadCvf(bytes, outRecord, outError);
}

} // namespace avfcomp
