#include "avfcomp/AvfFormat.hpp"
#include "avfcomp/Backend.hpp"
#include "avfcomp/Codec.hpp"
#include "avfcomp/Compression.hpp"
#include "avfcomp/CvfFormat.hpp"
#include "avfcomp/EventCodec.hpp"
#include "avfcomp/FileIO.hpp"
#include "avfcomp/Footer.hpp"
#include "avfcomp/MineField.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace avfcomp;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

// Hand-assembled AVF image. Mines are listed column by column, which is the
// order the CVF bitmap reproduces, so these fixtures round-trip byte-exactly.
struct AvfFixture {
  std::uint8_t version = 3;
  std::uint8_t prefix[4] = {0x11, 0x22, 0x33, 0x44};
  std::uint8_t level = 3;
  int cols = 8;
  int rows = 8;
  std::vector<MinePos> mines;

  std::vector<std::uint8_t> prestamp = {0x07, 0x08, 0x09};
  std::string tsInfo = "3|16.01.2025|12:34:56|0.34";
  std::vector<std::uint8_t> preevent = {0x10, 0x20, 0x30};
  std::vector<MouseEvent> events;

  std::string skinLabel = "Skin: ";
  std::string skin = "Classic";
  std::string player = "Player One";
  std::string arbiter = "0.52.3";
  // Empty: use the value the writer derives.
  std::string realTime;
};

MouseEvent Ev(MouseEventType t, std::uint32_t ms, int x, int y)
{
  MouseEvent e;
  e.type = t;
  e.gametime = ms;
  e.xpos = x;
  e.ypos = y;
  return e;
}

std::vector<MinePos> BeginnerMines()
{
  return {{1, 1}, {3, 1}, {2, 2}, {8, 2}, {4, 4}, {5, 5}, {1, 6}, {7, 6}, {2, 8}, {8, 8}};
}

std::vector<MouseEvent> ThreeEvents()
{
  return {Ev(MouseEventType::Move, 0, 10, 10), Ev(MouseEventType::Move, 10, 11, 10),
          Ev(MouseEventType::LeftDown, 20, 11, 10)};
}

void PutRecord(std::vector<std::uint8_t>& out, std::uint8_t mouse, std::uint32_t sec, std::uint8_t hun, int x, int y)
{
  out.push_back(mouse);
  out.push_back(static_cast<std::uint8_t>(x >> 8));
  out.push_back(static_cast<std::uint8_t>(sec & 0xFF));
  out.push_back(static_cast<std::uint8_t>(x & 0xFF));
  out.push_back(hun);
  out.push_back(static_cast<std::uint8_t>(y >> 8));
  out.push_back(static_cast<std::uint8_t>(sec >> 8));
  out.push_back(static_cast<std::uint8_t>(y & 0xFF));
}

std::vector<std::uint8_t> BuildAvf(const AvfFixture& f)
{
  std::vector<std::uint8_t> out;
  out.push_back(f.version);
  out.insert(out.end(), f.prefix, f.prefix + 4);
  out.push_back(f.level);
  if (f.level == 6) {
    out.push_back(static_cast<std::uint8_t>(f.cols - 1));
    out.push_back(static_cast<std::uint8_t>(f.rows - 1));
    out.push_back(static_cast<std::uint8_t>(f.mines.size() >> 8));
    out.push_back(static_cast<std::uint8_t>(f.mines.size() & 0xFF));
  }
  for (const MinePos& m : f.mines) {
    out.push_back(static_cast<std::uint8_t>(m.first));
    out.push_back(static_cast<std::uint8_t>(m.second));
  }

  out.insert(out.end(), f.prestamp.begin(), f.prestamp.end());
  out.push_back('[');
  out.insert(out.end(), f.tsInfo.begin(), f.tsInfo.end());
  out.push_back(']');
  out.insert(out.end(), f.preevent.begin(), f.preevent.end());

  for (const MouseEvent& e : f.events) {
    PutRecord(out, static_cast<std::uint8_t>(e.type), e.gametime / 1000 + 1,
              static_cast<std::uint8_t>((e.gametime % 1000) / 10), e.xpos, e.ypos);
  }

  // Sentinel record (stored seconds == 0), then the checksum tail.
  const std::uint8_t sentinel[8] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  out.insert(out.end(), sentinel, sentinel + 8);
  const std::string tail = std::string("\x05\x06", 2) + "cs=" + "0123456789abcdefg";
  out.insert(out.end(), tail.begin(), tail.end());

  std::string realTime = f.realTime;
  if (realTime.empty() && !f.events.empty()) {
    realTime = std::to_string(f.events.back().gametime / 1000) + f.tsInfo.substr(f.tsInfo.size() - 3);
  }
  const std::string footer = "RealTime: " + realTime + "\r" + f.skinLabel + f.skin + "\r" + f.player +
                             "\rMinesweeper Arbiter " + f.arbiter +
                             ". Copyright \xA9 2005-2006 Dmitriy I. Sukhomlynov";
  out.insert(out.end(), footer.begin(), footer.end());
  return out;
}

AvfFixture BeginnerFixture()
{
  AvfFixture f;
  f.mines = BeginnerMines();
  f.events = ThreeEvents();
  return f;
}

fs::path MakeTempDir(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp =
      static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  const fs::path dir = root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
  fs::create_directories(dir, ec);
  return dir;
}

} // namespace

static void TestParseBeginner()
{
  const std::vector<std::uint8_t> avf = BuildAvf(BeginnerFixture());

  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(avf, rec, err));
  EXPECT_TRUE(err.ok());

  EXPECT_EQ(rec.version, 3);
  EXPECT_EQ(rec.prefix[0], 0x11);
  EXPECT_EQ(rec.prefix[3], 0x44);
  EXPECT_EQ(rec.level, 3);
  EXPECT_EQ(rec.cols, 8);
  EXPECT_EQ(rec.rows, 8);
  EXPECT_EQ(rec.mineCount, 10);
  EXPECT_TRUE(rec.mines == BeginnerMines());

  EXPECT_EQ(rec.prestamp.size(), 3u);
  EXPECT_EQ(std::string(rec.tsInfo.begin(), rec.tsInfo.end()), std::string("3|16.01.2025|12:34:56|0.34"));
  EXPECT_TRUE(rec.preevent == std::vector<std::uint8_t>({0x10, 0x20, 0x30}));

  ASSERT_TRUE(rec.events.size() == 3);
  EXPECT_TRUE(rec.events == ThreeEvents());

  // Sentinel + 2 lead bytes + "cs=" + 17 bytes.
  EXPECT_EQ(rec.presuffix.size(), 8u + 2u + 3u + 17u);
  EXPECT_EQ(rec.presuffix[2], 0);
  EXPECT_EQ(rec.presuffix[6], 0);

  EXPECT_EQ(rec.footer.skin, std::string("Classic"));
  EXPECT_EQ(rec.footer.playerId, std::string("Player One"));
  EXPECT_EQ(rec.footer.arbiterVersion, std::string("0.52.3"));
}

static void TestWriteAvfIsByteExact()
{
  const std::vector<std::uint8_t> avf = BuildAvf(BeginnerFixture());

  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(avf, rec, err));

  std::vector<std::uint8_t> back;
  ASSERT_TRUE(WriteAvf(rec, back, err));
  EXPECT_TRUE(back == avf);
}

static void TestEndToEndThreeEvents()
{
  const std::vector<std::uint8_t> avf = BuildAvf(BeginnerFixture());

  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(avf, rec, err));

  std::vector<std::uint8_t> payload;
  EventBlockStats st;
  ASSERT_TRUE(EncodeEventBlock(rec.events, payload, err, &st));

  // Opcode run, then the end-of-opcodes marker.
  std::size_t opsLen = 0;
  while (opsLen < payload.size() && payload[opsLen] != 0xFF) ++opsLen;
  EXPECT_EQ(opsLen, 3u);
  EXPECT_EQ(st.events, 3u);
  EXPECT_EQ(st.compoundHits, 2u);
  EXPECT_EQ(st.residualTriples, 1u);

  std::vector<MouseEvent> decoded;
  ASSERT_TRUE(DecodeEventBlock(payload.data(), payload.size(), decoded, err));
  ASSERT_TRUE(decoded.size() == 3);
  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(decoded[i].gametime, rec.events[i].gametime);
    EXPECT_EQ(decoded[i].xpos, rec.events[i].xpos);
    EXPECT_EQ(decoded[i].ypos, rec.events[i].ypos);
    EXPECT_TRUE(decoded[i].type == rec.events[i].type);
  }
}

static void TestCvfRoundTrip()
{
  const std::vector<std::uint8_t> avf = BuildAvf(BeginnerFixture());

  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(avf, rec, err));

  std::vector<std::uint8_t> cvf;
  ASSERT_TRUE(WriteCvf(rec, cvf, err));
  EXPECT_TRUE(cvf.size() < avf.size());

  // Header (6 bytes) is followed directly by the 8-byte beginner bitmap.
  EXPECT_EQ(cvf[5], 3);
  EXPECT_EQ(cvf[6], 0x84);  // (1,1) and (1,6)

  ReplayRecord back;
  ASSERT_TRUE(ReadCvf(cvf, back, err));
  EXPECT_TRUE(back.mines == rec.mines);
  EXPECT_TRUE(back.events == rec.events);
  EXPECT_TRUE(back.preevent == rec.preevent);
  EXPECT_TRUE(back.presuffix == rec.presuffix);
  EXPECT_TRUE(back.footer == rec.footer);

  std::vector<std::uint8_t> restored;
  ASSERT_TRUE(WriteAvf(back, restored, err));
  EXPECT_TRUE(restored == avf);
}

static void TestStreamOverloads()
{
  const std::vector<std::uint8_t> avf = BuildAvf(BeginnerFixture());
  const std::string avfText(avf.begin(), avf.end());

  ReplayRecord rec;
  CodecError err;
  std::istringstream avfIn(avfText, std::ios::binary);
  ASSERT_TRUE(ParseAvf(avfIn, rec, err));
  EXPECT_EQ(rec.events.size(), 3u);

  std::ostringstream cvfOut(std::ios::binary);
  ASSERT_TRUE(WriteCvf(rec, cvfOut, err));

  std::vector<std::uint8_t> cvf;
  ASSERT_TRUE(WriteCvf(rec, cvf, err));
  EXPECT_TRUE(cvfOut.str() == std::string(cvf.begin(), cvf.end()));

  ReplayRecord back;
  std::istringstream cvfIn(cvfOut.str(), std::ios::binary);
  ASSERT_TRUE(ReadCvf(cvfIn, back, err));

  std::ostringstream avfOut(std::ios::binary);
  ASSERT_TRUE(WriteAvf(back, avfOut, err));
  EXPECT_TRUE(avfOut.str() == avfText);

  // A stream that is already broken reports an I/O error.
  std::ostringstream broken(std::ios::binary);
  broken.setstate(std::ios::badbit);
  CodecError ioErr;
  EXPECT_TRUE(!WriteAvf(back, broken, ioErr));
  EXPECT_TRUE(ioErr.code == ErrorCode::IoFailure);
}

static void TestEmptyPreevent()
{
  AvfFixture f = BeginnerFixture();
  f.preevent.clear();
  const std::vector<std::uint8_t> avf = BuildAvf(f);

  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(avf, rec, err));
  EXPECT_TRUE(rec.preevent.empty());
  EXPECT_EQ(rec.events.size(), 3u);

  std::vector<std::uint8_t> cvf;
  ASSERT_TRUE(CompressAvfBytes(avf, CodecOptions{}, cvf, err));
  std::vector<std::uint8_t> back;
  ASSERT_TRUE(DecompressCvfBytes(cvf, CodecOptions{}, back, err));
  EXPECT_TRUE(back == avf);
}

static void TestCustomLevelBoundary()
{
  AvfFixture f;
  f.level = 6;
  f.cols = 31;
  f.rows = 17;
  // First 101 cells in column order.
  for (int col = 1; col <= f.cols && f.mines.size() < 101; ++col) {
    for (int row = 1; row <= f.rows && f.mines.size() < 101; ++row) f.mines.emplace_back(row, col);
  }
  f.events = ThreeEvents();
  const std::vector<std::uint8_t> avf = BuildAvf(f);

  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(avf, rec, err));
  EXPECT_EQ(rec.cols, 31);
  EXPECT_EQ(rec.rows, 17);
  EXPECT_EQ(rec.mineCount, 101);

  std::vector<std::uint8_t> cvf;
  ASSERT_TRUE(WriteCvf(rec, cvf, err));
  ASSERT_TRUE(cvf.size() > 10);
  EXPECT_EQ(cvf[6], 0x1E);
  EXPECT_EQ(cvf[7], 0x10);
  EXPECT_EQ(cvf[8], 0x00);
  EXPECT_EQ(cvf[9], 0x65);
  EXPECT_EQ(MineBitmapSize(17, 31), 66u);

  ReplayRecord back;
  ASSERT_TRUE(ReadCvf(cvf, back, err));
  EXPECT_EQ(back.cols, 31);
  EXPECT_EQ(back.rows, 17);
  EXPECT_EQ(back.mineCount, 101);
  EXPECT_TRUE(back.mines == rec.mines);

  std::vector<std::uint8_t> restored;
  ASSERT_TRUE(WriteAvf(back, restored, err));
  EXPECT_TRUE(restored == avf);
  EXPECT_EQ(restored[6], 0x1E);
  EXPECT_EQ(restored[7], 0x10);
  EXPECT_EQ(restored[8], 0x00);
  EXPECT_EQ(restored[9], 0x65);
}

static void TestLargeJumpUsesResidual()
{
  AvfFixture f = BeginnerFixture();
  f.events.push_back(Ev(MouseEventType::Move, 30, 311, 10));
  f.events.push_back(Ev(MouseEventType::LeftUp, 1530, 311, 240));
  const std::vector<std::uint8_t> avf = BuildAvf(f);

  std::vector<std::uint8_t> cvf;
  CodecError err;
  CodecStats st;
  ASSERT_TRUE(CompressAvfBytes(avf, CodecOptions{}, cvf, err, &st));
  EXPECT_EQ(st.events, 5u);
  EXPECT_EQ(st.residualTriples, 3u);

  std::vector<std::uint8_t> back;
  ASSERT_TRUE(DecompressCvfBytes(cvf, CodecOptions{}, back, err));
  EXPECT_TRUE(back == avf);
}

static void TestDeltaTooLarge()
{
  AvfFixture f = BeginnerFixture();
  // zigzag(16390) = 32780 >= 0x8000
  f.events.push_back(Ev(MouseEventType::Move, 30, 16401, 10));
  const std::vector<std::uint8_t> avf = BuildAvf(f);

  std::vector<std::uint8_t> cvf;
  CodecError err;
  EXPECT_FALSE(CompressAvfBytes(avf, CodecOptions{}, cvf, err));
  EXPECT_TRUE(err.code == ErrorCode::ValueTooLarge);
  EXPECT_TRUE(CategoryOf(err.code) == ErrorCategory::Compression);
  EXPECT_TRUE(cvf.empty());

  // 400 s after the previous event: 40000 deciseconds.
  AvfFixture g = BeginnerFixture();
  g.events.push_back(Ev(MouseEventType::Move, 400020, 11, 10));
  err.clear();
  EXPECT_FALSE(CompressAvfBytes(BuildAvf(g), CodecOptions{}, cvf, err));
  EXPECT_TRUE(err.code == ErrorCode::ValueTooLarge);
}

static void TestFormatErrors()
{
  const std::vector<std::uint8_t> good = BuildAvf(BeginnerFixture());
  ReplayRecord rec;
  CodecError err;

  // Unknown level.
  std::vector<std::uint8_t> bad = good;
  bad[5] = 7;
  EXPECT_FALSE(ParseAvf(bad, rec, err));
  EXPECT_TRUE(err.code == ErrorCode::InvalidLevel);
  EXPECT_EQ(std::string(ErrorCategoryName(CategoryOf(err.code))), std::string("FormatError"));

  // Truncated in the header, in the mine list and in the event stream.
  for (std::size_t cut : {std::size_t(3), std::size_t(12), std::size_t(50)}) {
    bad.assign(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(cut));
    err.clear();
    EXPECT_FALSE(ParseAvf(bad, rec, err));
    EXPECT_TRUE(err.code == ErrorCode::Truncated);
  }

  // Unknown mouse code in the second event.
  AvfFixture f = BeginnerFixture();
  std::vector<std::uint8_t> withBadCode = BuildAvf(f);
  const std::size_t firstEvent = 6 + 20 + 3 + 1 + f.tsInfo.size() + 1 + f.preevent.size();
  withBadCode[firstEvent + 8] = 2;
  err.clear();
  EXPECT_FALSE(ParseAvf(withBadCode, rec, err));
  EXPECT_TRUE(err.code == ErrorCode::UnknownEventType);

  // Footer without the skin label.
  f.skinLabel = "Theme: ";
  err.clear();
  EXPECT_FALSE(ParseAvf(BuildAvf(f), rec, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);

  std::string described = DescribeError(err);
  EXPECT_TRUE(described.find("FormatError::MalformedFooter") == 0);
}

static void TestFooterRealTime()
{
  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(BuildAvf(BeginnerFixture()), rec, err));

  std::string rt;
  ASSERT_TRUE(ComputeRealTime(rec, rt, err));
  EXPECT_EQ(rt, std::string("0.34"));

  rec.events.back().gametime = 12340;
  ASSERT_TRUE(ComputeRealTime(rec, rt, err));
  EXPECT_EQ(rt, std::string("12.34"));

  rec.events.clear();
  EXPECT_FALSE(ComputeRealTime(rec, rt, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);
}

static void TestFootersThatCannotBeRebuilt()
{
  ReplayRecord rec;
  CodecError err;
  std::vector<std::uint8_t> cvf;
  const CodecOptions opt;

  // Stored RealTime disagrees with the events.
  AvfFixture f = BeginnerFixture();
  f.realTime = "9.99";
  EXPECT_FALSE(ParseAvf(BuildAvf(f), rec, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);
  err.clear();
  EXPECT_FALSE(CompressAvfBytes(BuildAvf(f), opt, cvf, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);

  // Text ahead of the skin label.
  f = BeginnerFixture();
  f.skinLabel = "xSkin: ";
  err.clear();
  EXPECT_FALSE(ParseAvf(BuildAvf(f), rec, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);

  // A field after the banner.
  std::vector<std::uint8_t> extra = BuildAvf(BeginnerFixture());
  const std::string tail = "\rextra";
  extra.insert(extra.end(), tail.begin(), tail.end());
  err.clear();
  EXPECT_FALSE(ParseAvf(extra, rec, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);
  EXPECT_TRUE(err.message.find("footer byte") != std::string::npos);

  // Banner with a different copyright text.
  std::vector<std::uint8_t> banner = BuildAvf(BeginnerFixture());
  banner[banner.size() - 4] = 'X';
  err.clear();
  EXPECT_FALSE(ParseAvf(banner, rec, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);
}

static void TestMinesOutOfColumnOrder()
{
  AvfFixture f = BeginnerFixture();
  f.mines = {{1, 1}, {1, 6}, {2, 2}, {2, 8}, {3, 1}, {4, 4}, {5, 5}, {7, 6}, {8, 2}, {8, 8}};
  const std::vector<std::uint8_t> avf = BuildAvf(f);

  // Parsing keeps the stored order; only the bitmap cannot represent it.
  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(avf, rec, err));
  std::vector<std::uint8_t> back;
  ASSERT_TRUE(WriteAvf(rec, back, err));
  EXPECT_TRUE(back == avf);

  std::vector<std::uint8_t> cvf;
  const CodecOptions opt;
  err.clear();
  EXPECT_FALSE(CompressAvfBytes(avf, opt, cvf, err));
  EXPECT_TRUE(err.code == ErrorCode::InvalidLevel);
  EXPECT_TRUE(cvf.empty());
}

static void TestVerifyCatchesLossyInput()
{
  // A hundredths byte above 99 is kept as read but written back normalised.
  AvfFixture f = BeginnerFixture();
  f.events = {Ev(MouseEventType::Move, 0, 10, 10), Ev(MouseEventType::Move, 10, 11, 10),
              Ev(MouseEventType::LeftDown, 2000, 11, 10)};
  std::vector<std::uint8_t> avf = BuildAvf(f);
  const std::size_t firstEvent = 6 + 20 + 3 + 1 + f.tsInfo.size() + 1 + f.preevent.size();
  avf[firstEvent + 8 + 4] = 101;

  CodecOptions opt;
  EXPECT_TRUE(opt.verify);
  std::vector<std::uint8_t> cvf;
  CodecError err;
  EXPECT_FALSE(CompressAvfBytes(avf, opt, cvf, err));
  EXPECT_TRUE(err.code == ErrorCode::RoundTripMismatch);
  EXPECT_TRUE(cvf.empty());

  opt.verify = false;
  err.clear();
  EXPECT_TRUE(CompressAvfBytes(avf, opt, cvf, err));

  opt.verify = true;
  err.clear();
  EXPECT_TRUE(CompressAvfBytes(BuildAvf(BeginnerFixture()), opt, cvf, err));
}

static void TestCvfDecodeErrors()
{
  ReplayRecord rec;
  CodecError err;
  ASSERT_TRUE(ParseAvf(BuildAvf(BeginnerFixture()), rec, err));

  std::vector<std::uint8_t> cvf;
  ASSERT_TRUE(WriteCvf(rec, cvf, err));

  // Locate the event block: the first 00 01 after the info block.
  const std::size_t close = static_cast<std::size_t>(
      std::find(cvf.begin(), cvf.end(), static_cast<std::uint8_t>(']')) - cvf.begin());
  std::size_t marker = close + 1;
  while (marker + 1 < cvf.size() && !(cvf[marker] == 0x00 && cvf[marker + 1] == 0x01)) ++marker;
  const std::size_t payload = marker + 2 + 3;
  ASSERT_TRUE(payload < cvf.size());

  std::vector<std::uint8_t> bad = cvf;
  bad[payload] = 252;
  ReplayRecord back;
  EXPECT_FALSE(ReadCvf(bad, back, err));
  EXPECT_TRUE(err.code == ErrorCode::UnknownOpcode);
  EXPECT_EQ(std::string(ErrorCategoryName(CategoryOf(err.code))), std::string("DecodeError"));

  bad.assign(cvf.begin(), cvf.begin() + static_cast<std::ptrdiff_t>(payload + 2));
  err.clear();
  EXPECT_FALSE(ReadCvf(bad, back, err));
  EXPECT_TRUE(err.code == ErrorCode::TruncatedBlock);

  // Footer with the wrong number of fields.
  bad = cvf;
  bad.push_back('\r');
  err.clear();
  EXPECT_FALSE(ReadCvf(bad, back, err));
  EXPECT_TRUE(err.code == ErrorCode::MalformedFooter);
}

static void TestBackends()
{
  const std::vector<std::uint8_t> avf = BuildAvf(BeginnerFixture());

  for (Backend b : {Backend::Plain, Backend::Gzip, Backend::Bzip2, Backend::Lzma, Backend::Sllz}) {
    CodecOptions opt;
    opt.backend.backend = b;
    opt.verify = true;

    std::vector<std::uint8_t> cvf;
    CodecError err;
    ASSERT_TRUE(CompressAvfBytes(avf, opt, cvf, err));
    EXPECT_TRUE(DetectBackend(cvf.data(), cvf.size()) == b);

    std::vector<std::uint8_t> back;
    ASSERT_TRUE(DecompressCvfBytes(cvf, CodecOptions{}, back, err));
    EXPECT_TRUE(back == avf);

    CodecOptions explicitRead;
    explicitRead.readBackend = b;
    back.clear();
    ASSERT_TRUE(DecompressCvfBytes(cvf, explicitRead, back, err));
    EXPECT_TRUE(back == avf);
  }

  // gzip magic and a bad gzip stream.
  CodecOptions gz;
  gz.backend.backend = Backend::Gzip;
  std::vector<std::uint8_t> cvf;
  CodecError err;
  ASSERT_TRUE(CompressAvfBytes(avf, gz, cvf, err));
  EXPECT_EQ(cvf[0], 0x1F);
  EXPECT_EQ(cvf[1], 0x8B);

  cvf.resize(cvf.size() / 2);
  std::vector<std::uint8_t> back;
  EXPECT_FALSE(DecompressCvfBytes(cvf, CodecOptions{}, back, err));
  EXPECT_TRUE(err.code == ErrorCode::BackendFailure);
  EXPECT_EQ(std::string(ErrorCategoryName(CategoryOf(err.code))), std::string("BackendError"));

  // xz is the default wrapper; bzip2 and xz streams are recognised by magic.
  EXPECT_TRUE(CodecOptions{}.backend.backend == Backend::Lzma);
  ASSERT_TRUE(CompressAvfBytes(avf, CodecOptions{}, cvf, err));
  const std::uint8_t xzMagic[6] = {0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00};
  ASSERT_TRUE(cvf.size() > 6);
  EXPECT_TRUE(std::equal(xzMagic, xzMagic + 6, cvf.begin()));

  cvf.resize(cvf.size() - 4);
  err.clear();
  EXPECT_FALSE(DecompressCvfBytes(cvf, CodecOptions{}, back, err));
  EXPECT_TRUE(err.code == ErrorCode::BackendFailure);

  CodecOptions bz;
  bz.backend.backend = Backend::Bzip2;
  bz.backend.level = 0;
  err.clear();
  ASSERT_TRUE(CompressAvfBytes(avf, bz, cvf, err));
  EXPECT_EQ(cvf[0], 'B');
  EXPECT_EQ(cvf[1], 'Z');
  EXPECT_EQ(cvf[2], 'h');

  cvf.resize(cvf.size() / 2);
  err.clear();
  EXPECT_FALSE(DecompressCvfBytes(cvf, CodecOptions{}, back, err));
  EXPECT_TRUE(err.code == ErrorCode::BackendFailure);

  // Levels outside -1..9 are refused for every backend.
  CodecOptions badLevel;
  badLevel.backend.level = 12;
  err.clear();
  EXPECT_FALSE(CompressAvfBytes(avf, badLevel, cvf, err));
  EXPECT_TRUE(err.code == ErrorCode::BackendFailure);

  Backend parsed = Backend::Plain;
  EXPECT_TRUE(ParseBackend("sllz", parsed));
  EXPECT_TRUE(parsed == Backend::Sllz);
  EXPECT_TRUE(ParseBackend("xz", parsed));
  EXPECT_TRUE(parsed == Backend::Lzma);
  EXPECT_TRUE(ParseBackend("bz2", parsed));
  EXPECT_TRUE(parsed == Backend::Bzip2);
  EXPECT_FALSE(ParseBackend("zstd", parsed));
  EXPECT_EQ(std::string(BackendName(Backend::Gzip)), std::string("gzip"));
  EXPECT_EQ(std::string(BackendName(Backend::Lzma)), std::string("lzma"));
}

static void TestSllzFrames()
{
  std::vector<std::uint8_t> data;
  for (int i = 0; i < 5000; ++i) data.push_back(static_cast<std::uint8_t>((i % 17) * 3));
  std::uint32_t s = 12345u;
  for (int i = 0; i < 2000; ++i) {
    s = s * 1103515245u + 12345u;
    data.push_back(static_cast<std::uint8_t>(s >> 24));
  }

  std::vector<std::uint8_t> packed;
  CompressSllz(data.data(), data.size(), packed);
  EXPECT_TRUE(HasSllzMagic(packed.data(), packed.size()));
  EXPECT_TRUE(packed.size() < data.size());

  std::vector<std::uint8_t> unpacked;
  CodecError err;
  ASSERT_TRUE(DecompressSllz(packed.data(), packed.size(), unpacked, err));
  EXPECT_TRUE(unpacked == data);

  // Empty input is a bare header.
  CompressSllz(nullptr, 0, packed);
  EXPECT_EQ(packed.size(), kSllzHeaderSize);
  ASSERT_TRUE(DecompressSllz(packed.data(), packed.size(), unpacked, err));
  EXPECT_TRUE(unpacked.empty());

  // Declared size larger than the commands produce.
  CompressSllz(data.data(), data.size(), packed);
  packed[7] = static_cast<std::uint8_t>(packed[7] + 1);
  err.clear();
  EXPECT_FALSE(DecompressSllz(packed.data(), packed.size(), unpacked, err));
  EXPECT_TRUE(err.code == ErrorCode::BackendFailure);

  // A 4 GiB size claim on a tiny body is refused before any allocation.
  const std::vector<std::uint8_t> huge = {'S', 'L', 'Z', '1', 0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x41};
  err.clear();
  EXPECT_FALSE(DecompressSllz(huge.data(), huge.size(), unpacked, err));
  EXPECT_TRUE(err.code == ErrorCode::BackendFailure);
  EXPECT_TRUE(err.message.find("declares") != std::string::npos);
  EXPECT_TRUE(unpacked.empty());
}

static void TestFileRoundTrip()
{
  const fs::path dir = MakeTempDir("avfcomp_files");
  const fs::path avfPath = dir / "game.avf";
  const fs::path cvfPath = dir / "out" / "game.cvf";
  const fs::path restoredPath = dir / "restored.avf";

  const std::vector<std::uint8_t> avf = BuildAvf(BeginnerFixture());
  CodecError err;
  ASSERT_TRUE(WriteFileAtomic(avfPath, avf, err));

  // Plain output: the fixture is too small for an outer compressor to pay off.
  CodecOptions plain;
  plain.backend.backend = Backend::Plain;
  CodecStats st;
  ASSERT_TRUE(CompressFile(avfPath, cvfPath, plain, err, &st));
  EXPECT_EQ(st.inputBytes, avf.size());
  EXPECT_TRUE(st.ratio() > 0.0 && st.ratio() < 1.0);
  EXPECT_TRUE(fs::exists(cvfPath));
  EXPECT_FALSE(fs::exists(fs::path(cvfPath.string() + ".tmp")));

  ASSERT_TRUE(DecompressFile(cvfPath, restoredPath, CodecOptions{}, err));
  std::vector<std::uint8_t> restored;
  ASSERT_TRUE(ReadFileBytes(restoredPath, restored, err));
  EXPECT_TRUE(restored == avf);

  // A failed run leaves nothing at the destination.
  const fs::path junkPath = dir / "junk.avf";
  const fs::path junkOut = dir / "junk.cvf";
  ASSERT_TRUE(WriteFileAtomic(junkPath, std::vector<std::uint8_t>{3, 1, 2}, err));
  EXPECT_FALSE(CompressFile(junkPath, junkOut, CodecOptions{}, err));
  EXPECT_TRUE(err.code == ErrorCode::Truncated);
  EXPECT_FALSE(fs::exists(junkOut));

  err.clear();
  EXPECT_FALSE(ReadFileBytes(dir / "missing.avf", restored, err));
  EXPECT_TRUE(err.code == ErrorCode::IoFailure);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

int main()
{
  TestParseBeginner();
  TestWriteAvfIsByteExact();
  TestEndToEndThreeEvents();
  TestCvfRoundTrip();
  TestStreamOverloads();
  TestEmptyPreevent();
  TestCustomLevelBoundary();
  TestLargeJumpUsesResidual();
  TestDeltaTooLarge();
  TestFormatErrors();
  TestFooterRealTime();
  TestFootersThatCannotBeRebuilt();
  TestMinesOutOfColumnOrder();
  TestVerifyCatchesLossyInput();
  TestCvfDecodeErrors();
  TestBackends();
  TestSllzFrames();
  TestFileRoundTrip();

  if (g_failures == 0) {
    std::cout << "avfcomp_tests: OK\n";
    return 0;
  }

  std::cerr << "avfcomp_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
