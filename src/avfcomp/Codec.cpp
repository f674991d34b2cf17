#include "avfcomp/Codec.hpp"

#include "avfcomp/AvfFormat.hpp"
#include "avfcomp/CvfFormat.hpp"
#include "avfcomp/EventCodec.hpp"
#include "avfcomp/FileIO.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace avfcomp {

namespace {

using Clock = std::chrono::steady_clock;

double SecondsSince(Clock::time_point t0)
{
  return std::chrono::duration<double>(Clock::now() - t0).count();
}

// Index of the first differing byte, or the shorter length.
std::size_t FirstMismatch(const std::vector<std::uint8_t>& a, const std::vector<std::uint8_t>& b)
{
  const std::size_t n = std::min(a.size(), b.size());
  const auto it = std::mismatch(a.begin(), a.begin() + static_cast<std::ptrdiff_t>(n), b.begin());
  return static_cast<std::size_t>(it.first - a.begin());
}

} // namespace

double CodecStats::ratio() const
{
  if (inputBytes == 0) return 0.0;
  return static_cast<double>(outputBytes) / static_cast<double>(inputBytes);
}

void CodecStats::accumulate(const CodecStats& o)
{
  inputBytes += o.inputBytes;
  cvfBytes += o.cvfBytes;
  outputBytes += o.outputBytes;
  events += o.events;
  compoundHits += o.compoundHits;
  residualTriples += o.residualTriples;
  seconds += o.seconds;
}

bool LoadCvfRecord(const std::vector<std::uint8_t>& cvf, Backend backend, ReplayRecord& outRecord,
                   CodecError& outError)
{
  std::vector<std::uint8_t> image;
  if (!UnwrapBytes(cvf, backend, image, outError)) return false;
  return ReadCvf(image, outRecord, outError);
}

bool CompressAvfBytes(const std::vector<std::uint8_t>& avf, const CodecOptions& opt, std::vector<std::uint8_t>& outCvf,
                      CodecError& outError, CodecStats* stats)
{
  const Clock::time_point t0 = Clock::now();
  outCvf.clear();

  ReplayRecord rec;
  if (!ParseAvf(avf, rec, outError)) return false;

  std::vector<std::uint8_t> image;
  EventBlockStats blockStats;
  if (!WriteCvf(rec, image, outError, &blockStats)) return false;

  std::vector<std::uint8_t> wrapped;
  if (!WrapBytes(image, opt.backend, wrapped, outError)) return false;

  if (opt.verify) {
    ReplayRecord back;
    std::vector<std::uint8_t> restored;
    if (!LoadCvfRecord(wrapped, opt.backend.backend, back, outError)) return false;
    if (!WriteAvf(back, restored, outError)) return false;
    if (restored != avf) {
      return Fail(outError, ErrorCode::RoundTripMismatch,
                  "decoded replay differs from input at byte " + std::to_string(FirstMismatch(restored, avf)) +
                      " (" + std::to_string(restored.size()) + " vs " + std::to_string(avf.size()) + " bytes)");
    }
  }

  if (stats) {
    stats->inputBytes = avf.size();
    stats->cvfBytes = image.size();
    stats->outputBytes = wrapped.size();
    stats->events = blockStats.events;
    stats->compoundHits = blockStats.compoundHits;
    stats->residualTriples = blockStats.residualTriples;
    stats->seconds = SecondsSince(t0);
  }

  outCvf.swap(wrapped);
  return true;
}

bool DecompressCvfBytes(const std::vector<std::uint8_t>& cvf, const CodecOptions& opt,
                        std::vector<std::uint8_t>& outAvf, CodecError& outError, CodecStats* stats)
{
  const Clock::time_point t0 = Clock::now();
  outAvf.clear();

  std::vector<std::uint8_t> image;
  if (!UnwrapBytes(cvf, opt.readBackend, image, outError)) return false;

  ReplayRecord rec;
  EventBlockStats blockStats;
  if (!ReadCvf(image, rec, outError, &blockStats)) return false;

  std::vector<std::uint8_t> avf;
  if (!WriteAvf(rec, avf, outError)) return false;

  if (stats) {
    stats->inputBytes = cvf.size();
    stats->cvfBytes = image.size();
    stats->outputBytes = avf.size();
    stats->events = blockStats.events;
    stats->compoundHits = blockStats.compoundHits;
    stats->residualTriples = blockStats.residualTriples;
    stats->seconds = SecondsSince(t0);
  }

  outAvf.swap(avf);
  return true;
}

bool CompressFile(const std::filesystem::path& inPath, const std::filesystem::path& outPath, const CodecOptions& opt,
                  CodecError& outError, CodecStats* stats)
{
  std::vector<std::uint8_t> in;
  if (!ReadFileBytes(inPath, in, outError)) return false;

  std::vector<std::uint8_t> out;
  if (!CompressAvfBytes(in, opt, out, outError, stats)) {
    outError.message = inPath.string() + ": " + outError.message;
    return false;
  }
  return WriteFileAtomic(outPath, out, outError);
}

bool DecompressFile(const std::filesystem::path& inPath, const std::filesystem::path& outPath,
                    const CodecOptions& opt, CodecError& outError, CodecStats* stats)
{
  std::vector<std::uint8_t> in;
  if (!ReadFileBytes(inPath, in, outError)) return false;

  std::vector<std::uint8_t> out;
  if (!DecompressCvfBytes(in, opt, out, outError, stats)) {
    outError.message = inPath.string() + ": " + outError.message;
    return false;
  }
  return WriteFileAtomic(outPath, out, outError);
}

} // namespace avfcomp
