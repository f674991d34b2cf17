#include "avfcomp/AvfFormat.hpp"
#include "avfcomp/Codec.hpp"
#include "avfcomp/ConfigIO.hpp"
#include "avfcomp/FileIO.hpp"
#include "avfcomp/Footer.hpp"
#include "avfcomp/LogTee.hpp"
#include "avfcomp/Version.hpp"
#include "cli/CliParse.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace avfcomp;
using avfcomp::cli::CliArgs;
using avfcomp::cli::Mode;

void PrintHelp()
{
  std::cout
      << "avfcomp (Minesweeper Arbiter replay compressor)\n\n"
      << "Usage:\n"
      << "  avfcomp compress   <in.avf>... [--out-dir D | -o out.cvf] [--backend B] [--level N] [--no-verify]\n"
      << "  avfcomp decompress <in.cvf>... [--out-dir D | -o out.avf] [--backend B]\n"
      << "  avfcomp verify     <in.avf>...\n"
      << "  avfcomp inspect    <file> [--cvf]\n\n"
      << "Options:\n"
      << "  --backend <name>     plain | gzip | bzip2 | lzma | sllz | auto (default lzma; auto sniffs on read)\n"
      << "  --level <0..9>       compression level (default: the backend's own)\n"
      << "  --verify             decode each output again and compare with the input (default)\n"
      << "  --no-verify          skip that check\n"
      << "  --config <json>      load settings (merge semantics)\n"
      << "  --log <path>         tee stdout/stderr into a timestamped log file\n"
      << "  --log-keep <n>       rotated log backups to keep (default 3)\n"
      << "  --print-config       print the effective settings as JSON and exit\n"
      << "  --quiet              only print errors\n"
      << "  --version            print version and exit\n\n"
      << "Environment:\n"
      << "  AVFCOMP_BACKEND      default backend\n"
      << "  AVFCOMP_LOG          default log path\n\n"
      << "Exit codes: 0 ok, 1 no arguments, 2 usage/config error, 3 one or more files failed.\n";
}

std::string HexBytes(const std::uint8_t* p, std::size_t n)
{
  std::ostringstream oss;
  for (std::size_t i = 0; i < n; ++i) {
    if (i) oss << ' ';
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(p[i]);
  }
  return oss.str();
}

void PrintStatsLine(const std::string& label, const CodecStats& st)
{
  std::cout << label << ": " << st.inputBytes << " -> " << st.outputBytes << " bytes"
            << " (ratio " << std::fixed << std::setprecision(3) << st.ratio() << ", events " << st.events
            << ", dict " << st.compoundHits << ", residual " << st.residualTriples << ")\n";
  std::cout.unsetf(std::ios::floatfield);
}

void PrintTotals(const CodecStats& total, std::size_t ok, std::size_t failed)
{
  const double mb = static_cast<double>(total.inputBytes) / (1024.0 * 1024.0);
  const double mbps = total.seconds > 0.0 ? mb / total.seconds : 0.0;
  std::cout << "Total: " << ok << " ok, " << failed << " failed, " << total.inputBytes << " -> "
            << total.outputBytes << " bytes, ratio " << std::fixed << std::setprecision(3) << total.ratio() << ", "
            << std::setprecision(2) << mbps << " MB/s\n";
  std::cout.unsetf(std::ios::floatfield);
}

void PrintRecord(const std::string& path, const ReplayRecord& rec)
{
  std::cout << "Replay: " << path << "\n";
  std::cout << "  version: " << static_cast<int>(rec.version) << "  prefix: " << HexBytes(rec.prefix.data(), 4)
            << "\n";
  std::cout << "  level: " << static_cast<int>(rec.level) << "  board: " << rec.cols << "x" << rec.rows
            << "  mines: " << rec.mineCount << "\n";
  std::cout << "  info: " << std::string(rec.tsInfo.begin(), rec.tsInfo.end()) << "\n";
  std::cout << "  prestamp: " << rec.prestamp.size() << " bytes  preevent: " << rec.preevent.size()
            << " bytes  presuffix: " << rec.presuffix.size() << " bytes\n";
  std::cout << "  events: " << rec.events.size();

  std::string realTime;
  CodecError err;
  if (ComputeRealTime(rec, realTime, err)) std::cout << "  real time: " << realTime;
  std::cout << "\n";

  std::map<std::uint8_t, std::size_t> byType;
  for (const MouseEvent& e : rec.events) ++byType[static_cast<std::uint8_t>(e.type)];
  for (const auto& kv : byType) {
    std::cout << "    " << MouseEventTypeName(static_cast<MouseEventType>(kv.first)) << " (" << static_cast<int>(kv.first)
              << "): " << kv.second << "\n";
  }

  std::cout << "  skin: " << rec.footer.skin << "\n";
  std::cout << "  player: " << rec.footer.playerId << "\n";
  std::cout << "  arbiter: " << rec.footer.arbiterVersion << "\n";
}

int RunInspect(const CliArgs& args, const CodecOptions& opt)
{
  const std::string& path = args.inputs.front();
  std::vector<std::uint8_t> bytes;
  CodecError err;
  ReplayRecord rec;

  bool ok = ReadFileBytes(path, bytes, err);
  if (ok) {
    ok = args.cvf ? LoadCvfRecord(bytes, opt.readBackend, rec, err) : ParseAvf(bytes, rec, err);
  }
  if (!ok) {
    std::cerr << path << ": " << DescribeError(err) << "\n";
    return 3;
  }
  PrintRecord(path, rec);
  return 0;
}

// Compress + decompress in memory; nothing is written.
bool VerifyOne(const std::string& path, const CodecOptions& opt, CodecStats& st, CodecError& err)
{
  std::vector<std::uint8_t> avf;
  if (!ReadFileBytes(path, avf, err)) return false;

  std::vector<std::uint8_t> cvf;
  if (!CompressAvfBytes(avf, opt, cvf, err, &st)) return false;

  std::vector<std::uint8_t> back;
  CodecOptions readOpt = opt;
  readOpt.readBackend = Backend::Auto;
  if (!DecompressCvfBytes(cvf, readOpt, back, err)) return false;
  if (back != avf) {
    return Fail(err, ErrorCode::RoundTripMismatch, "decompressed replay differs from input");
  }
  return true;
}

int RunBatch(const CliArgs& args, const CodecConfig& cfg, const CodecOptions& opt)
{
  CodecStats total;
  std::size_t okCount = 0;
  std::size_t failCount = 0;

  for (const std::string& in : args.inputs) {
    CodecStats st;
    CodecError err;
    bool ok = false;
    std::filesystem::path outPath;

    if (args.mode == Mode::Verify) {
      ok = VerifyOne(in, opt, st, err);
    } else {
      outPath = cli::OutputPathFor(args, in);
      std::error_code ec;
      if (std::filesystem::equivalent(in, outPath, ec)) {
        (void)Fail(err, ErrorCode::IoFailure, "output would overwrite the input: " + outPath.string());
      } else if (args.mode == Mode::Compress) {
        ok = CompressFile(in, outPath, opt, err, &st);
      } else {
        ok = DecompressFile(in, outPath, opt, err, &st);
      }
    }

    if (!ok) {
      ++failCount;
      std::cerr << in << ": " << DescribeError(err) << "\n";
      continue;
    }

    ++okCount;
    total.accumulate(st);
    if (!cfg.quiet) {
      PrintStatsLine(outPath.empty() ? in : in + " -> " + outPath.string(), st);
    }
  }

  if (!cfg.quiet || failCount > 0) PrintTotals(total, okCount, failCount);
  return failCount > 0 ? 3 : 0;
}

} // namespace

int main(int argc, char** argv)
{
  if (argc < 2) {
    PrintHelp();
    return 1;
  }

  CliArgs args;
  std::string err;
  if (!cli::ParseCliArgs(argc, argv, args, err)) {
    std::cerr << err << "\n\n";
    PrintHelp();
    return 2;
  }
  if (!cli::CheckDistinctOutputs(args, err)) {
    std::cerr << err << "\n";
    return 2;
  }
  if (args.help) {
    PrintHelp();
    return 0;
  }
  if (args.version) {
    std::cout << "avfcomp " << AvfCompFullVersionString() << "\n";
    return 0;
  }

  CodecConfig cfg;
  if (!args.configPath.empty() && !LoadCodecConfigJsonFile(args.configPath, cfg, err)) {
    std::cerr << "Config load failed: " << err << "\n";
    return 2;
  }
  if (!ApplyCodecConfigEnv(cfg, err)) {
    std::cerr << err << "\n";
    return 2;
  }
  cli::ApplyCliOverrides(args, cfg);

  if (args.printConfig) {
    std::cout << CodecConfigToJson(cfg);
    return 0;
  }

  LogTee log;
  if (!cfg.logPath.empty()) {
    LogTeeOptions logOpt;
    logOpt.path = cfg.logPath;
    logOpt.keepFiles = cfg.logKeep;
    if (!log.start(logOpt, err)) {
      // Not fatal: the console still has everything.
      std::cerr << "Log disabled: " << err << "\n";
    }
  }

  CodecOptions opt = MakeCodecOptions(cfg);
  if (args.backend && (args.mode == Mode::Decompress || args.mode == Mode::Inspect)) {
    opt.readBackend = *args.backend;
  }

  if (args.mode == Mode::Inspect) return RunInspect(args, opt);
  return RunBatch(args, cfg, opt);
}
