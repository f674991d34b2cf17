#include "avfcomp/Backend.hpp"

#include "avfcomp/Compression.hpp"

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <algorithm>
#include <limits>

namespace avfcomp {

namespace {

// windowBits + 16 selects a gzip wrapper for deflate; + 32 lets inflate accept
// both gzip and zlib headers.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kInflateAutoWindowBits = 15 + 32;
constexpr std::size_t kChunk = 64 * 1024;

constexpr int kGzipDefaultLevel = 9;
constexpr int kBzip2DefaultLevel = 9;
constexpr std::uint32_t kXzDefaultPreset = 6;

constexpr std::uint8_t kXzMagic[6] = {0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00};

std::string ZlibMessage(const char* what, int rc, const z_stream& zs)
{
  std::string msg = what;
  msg += " failed (zlib ";
  msg += std::to_string(rc);
  msg += ")";
  if (zs.msg) {
    msg += ": ";
    msg += zs.msg;
  }
  return msg;
}

bool GzipCompress(const std::vector<std::uint8_t>& raw, int level, std::vector<std::uint8_t>& out,
                  CodecError& outError)
{
  if (raw.size() > std::numeric_limits<uInt>::max()) {
    return Fail(outError, ErrorCode::BackendFailure, "input too large for a single gzip member");
  }

  z_stream zs{};
  int rc = deflateInit2(&zs, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    return Fail(outError, ErrorCode::BackendFailure, ZlibMessage("deflateInit2", rc, zs));
  }

  out.resize(deflateBound(&zs, static_cast<uLong>(raw.size())));
  zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(raw.data()));
  zs.avail_in = static_cast<uInt>(raw.size());
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());

  rc = deflate(&zs, Z_FINISH);
  const std::size_t produced = zs.total_out;
  deflateEnd(&zs);

  if (rc != Z_STREAM_END) {
    out.clear();
    return Fail(outError, ErrorCode::BackendFailure, ZlibMessage("deflate", rc, zs));
  }
  out.resize(produced);
  return true;
}

bool GzipDecompress(const std::vector<std::uint8_t>& wrapped, std::vector<std::uint8_t>& out, CodecError& outError)
{
  if (wrapped.size() > std::numeric_limits<uInt>::max()) {
    return Fail(outError, ErrorCode::BackendFailure, "gzip input too large");
  }

  z_stream zs{};
  int rc = inflateInit2(&zs, kInflateAutoWindowBits);
  if (rc != Z_OK) {
    return Fail(outError, ErrorCode::BackendFailure, ZlibMessage("inflateInit2", rc, zs));
  }

  zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(wrapped.data()));
  zs.avail_in = static_cast<uInt>(wrapped.size());

  out.clear();
  std::vector<std::uint8_t> chunk(kChunk);
  do {
    zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      const std::string msg = ZlibMessage("inflate", rc, zs);
      inflateEnd(&zs);
      out.clear();
      return Fail(outError, ErrorCode::BackendFailure, msg);
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(chunk.size() - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      out.clear();
      return Fail(outError, ErrorCode::BackendFailure, "gzip stream ends before its trailer");
    }
  } while (rc != Z_STREAM_END);

  inflateEnd(&zs);
  return true;
}

std::string LzmaMessage(const char* what, lzma_ret rc)
{
  std::string msg = what;
  msg += " failed (lzma ";
  msg += std::to_string(static_cast<int>(rc));
  msg += ")";
  switch (rc) {
  case LZMA_MEM_ERROR: msg += ": out of memory"; break;
  case LZMA_FORMAT_ERROR: msg += ": not an xz stream"; break;
  case LZMA_OPTIONS_ERROR: msg += ": unsupported options"; break;
  case LZMA_DATA_ERROR: msg += ": corrupt data"; break;
  case LZMA_BUF_ERROR: msg += ": stream ends early"; break;
  default: break;
  }
  return msg;
}

bool XzCompress(const std::vector<std::uint8_t>& raw, int level, std::vector<std::uint8_t>& out,
                CodecError& outError)
{
  const std::uint32_t preset = level < 0 ? kXzDefaultPreset : static_cast<std::uint32_t>(level);

  out.resize(lzma_stream_buffer_bound(raw.size()));
  std::size_t outPos = 0;
  const lzma_ret rc = lzma_easy_buffer_encode(preset, LZMA_CHECK_CRC64, nullptr, raw.data(), raw.size(),
                                              out.data(), &outPos, out.size());
  if (rc != LZMA_OK) {
    out.clear();
    return Fail(outError, ErrorCode::BackendFailure, LzmaMessage("lzma_easy_buffer_encode", rc));
  }
  out.resize(outPos);
  return true;
}

// Accepts .xz and legacy .lzma streams, including concatenated xz streams.
bool XzDecompress(const std::vector<std::uint8_t>& wrapped, std::vector<std::uint8_t>& out, CodecError& outError)
{
  lzma_stream strm = LZMA_STREAM_INIT;
  lzma_ret rc = lzma_auto_decoder(&strm, std::numeric_limits<std::uint64_t>::max(), LZMA_CONCATENATED);
  if (rc != LZMA_OK) {
    return Fail(outError, ErrorCode::BackendFailure, LzmaMessage("lzma_auto_decoder", rc));
  }

  strm.next_in = wrapped.data();
  strm.avail_in = wrapped.size();

  out.clear();
  std::vector<std::uint8_t> chunk(kChunk);
  lzma_action action = LZMA_RUN;
  do {
    if (strm.avail_in == 0) action = LZMA_FINISH;
    strm.next_out = chunk.data();
    strm.avail_out = chunk.size();
    rc = lzma_code(&strm, action);
    if (rc != LZMA_OK && rc != LZMA_STREAM_END) {
      lzma_end(&strm);
      out.clear();
      return Fail(outError, ErrorCode::BackendFailure, LzmaMessage("lzma_code", rc));
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(chunk.size() - strm.avail_out));
  } while (rc != LZMA_STREAM_END);

  lzma_end(&strm);
  return true;
}

bool Bzip2Compress(const std::vector<std::uint8_t>& raw, int level, std::vector<std::uint8_t>& out,
                   CodecError& outError)
{
  if (raw.size() > std::numeric_limits<unsigned int>::max() / 2u) {
    return Fail(outError, ErrorCode::BackendFailure, "input too large for a single bzip2 buffer");
  }
  const int blockSize100k = level < 0 ? kBzip2DefaultLevel : std::max(1, level);

  // bzip2 documents size + 1% + 600 bytes as the worst case.
  unsigned int destLen = static_cast<unsigned int>(raw.size() + raw.size() / 100u + 600u);
  out.resize(destLen);
  const int rc = BZ2_bzBuffToBuffCompress(reinterpret_cast<char*>(out.data()), &destLen,
                                          const_cast<char*>(reinterpret_cast<const char*>(raw.data())),
                                          static_cast<unsigned int>(raw.size()), blockSize100k, 0, 0);
  if (rc != BZ_OK) {
    out.clear();
    return Fail(outError, ErrorCode::BackendFailure,
                "BZ2_bzBuffToBuffCompress failed (bzip2 " + std::to_string(rc) + ")");
  }
  out.resize(destLen);
  return true;
}

// Streams are decoded back to back until the input is used up, so
// multi-stream files read the same way as with the bzip2 tool.
bool Bzip2Decompress(const std::vector<std::uint8_t>& wrapped, std::vector<std::uint8_t>& out, CodecError& outError)
{
  if (wrapped.size() > std::numeric_limits<unsigned int>::max()) {
    return Fail(outError, ErrorCode::BackendFailure, "bzip2 input too large");
  }

  out.clear();
  if (wrapped.empty()) return Fail(outError, ErrorCode::BackendFailure, "empty bzip2 input");

  std::vector<std::uint8_t> chunk(kChunk);
  std::size_t consumed = 0;
  while (consumed < wrapped.size()) {
    bz_stream bs{};
    int rc = BZ2_bzDecompressInit(&bs, 0, 0);
    if (rc != BZ_OK) {
      out.clear();
      return Fail(outError, ErrorCode::BackendFailure, "BZ2_bzDecompressInit failed (bzip2 " + std::to_string(rc) + ")");
    }

    bs.next_in = const_cast<char*>(reinterpret_cast<const char*>(wrapped.data() + consumed));
    bs.avail_in = static_cast<unsigned int>(wrapped.size() - consumed);
    do {
      bs.next_out = reinterpret_cast<char*>(chunk.data());
      bs.avail_out = static_cast<unsigned int>(chunk.size());
      rc = BZ2_bzDecompress(&bs);
      if (rc != BZ_OK && rc != BZ_STREAM_END) {
        BZ2_bzDecompressEnd(&bs);
        out.clear();
        return Fail(outError, ErrorCode::BackendFailure, "BZ2_bzDecompress failed (bzip2 " + std::to_string(rc) + ")");
      }
      out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(chunk.size() - bs.avail_out));
      if (rc == BZ_OK && bs.avail_in == 0 && bs.avail_out != 0) {
        BZ2_bzDecompressEnd(&bs);
        out.clear();
        return Fail(outError, ErrorCode::BackendFailure, "bzip2 stream ends before its end-of-stream marker");
      }
    } while (rc != BZ_STREAM_END);

    consumed = wrapped.size() - bs.avail_in;
    BZ2_bzDecompressEnd(&bs);
  }
  return true;
}

} // namespace

const char* BackendName(Backend b)
{
  switch (b) {
  case Backend::Plain: return "plain";
  case Backend::Gzip: return "gzip";
  case Backend::Bzip2: return "bzip2";
  case Backend::Lzma: return "lzma";
  case Backend::Sllz: return "sllz";
  case Backend::Auto: return "auto";
  }
  return "unknown";
}

bool ParseBackend(const std::string& name, Backend& out)
{
  if (name == "plain" || name == "none") {
    out = Backend::Plain;
  } else if (name == "gzip" || name == "gz") {
    out = Backend::Gzip;
  } else if (name == "bzip2" || name == "bz2") {
    out = Backend::Bzip2;
  } else if (name == "lzma" || name == "xz") {
    out = Backend::Lzma;
  } else if (name == "sllz") {
    out = Backend::Sllz;
  } else if (name == "auto") {
    out = Backend::Auto;
  } else {
    return false;
  }
  return true;
}

Backend DetectBackend(const std::uint8_t* data, std::size_t size)
{
  if (data && size >= 2 && data[0] == 0x1Fu && data[1] == 0x8Bu) return Backend::Gzip;
  if (data && size >= 3 && data[0] == 'B' && data[1] == 'Z' && data[2] == 'h') return Backend::Bzip2;
  if (data && size >= sizeof(kXzMagic) && std::equal(kXzMagic, kXzMagic + sizeof(kXzMagic), data)) {
    return Backend::Lzma;
  }
  if (HasSllzMagic(data, size)) return Backend::Sllz;
  return Backend::Plain;
}

bool WrapBytes(const std::vector<std::uint8_t>& raw, const BackendOptions& opt, std::vector<std::uint8_t>& out,
               CodecError& outError)
{
  if (opt.level < -1 || opt.level > 9) {
    return Fail(outError, ErrorCode::BackendFailure, "compression level must be -1..9");
  }

  switch (opt.backend) {
  case Backend::Plain:
    out = raw;
    return true;
  case Backend::Gzip: return GzipCompress(raw, opt.level < 0 ? kGzipDefaultLevel : opt.level, out, outError);
  case Backend::Bzip2: return Bzip2Compress(raw, opt.level, out, outError);
  case Backend::Lzma: return XzCompress(raw, opt.level, out, outError);
  case Backend::Sllz:
    if (raw.size() > std::numeric_limits<std::uint32_t>::max()) {
      return Fail(outError, ErrorCode::BackendFailure, "input too large for an SLLZ frame");
    }
    CompressSllz(raw.data(), raw.size(), out);
    return true;
  case Backend::Auto:
    break;
  }
  return Fail(outError, ErrorCode::BackendFailure, "no backend selected for writing");
}

bool UnwrapBytes(const std::vector<std::uint8_t>& wrapped, Backend backend, std::vector<std::uint8_t>& out,
                 CodecError& outError)
{
  if (backend == Backend::Auto) backend = DetectBackend(wrapped.data(), wrapped.size());

  switch (backend) {
  case Backend::Plain:
    out = wrapped;
    return true;
  case Backend::Gzip: return GzipDecompress(wrapped, out, outError);
  case Backend::Bzip2: return Bzip2Decompress(wrapped, out, outError);
  case Backend::Lzma: return XzDecompress(wrapped, out, outError);
  case Backend::Sllz: return DecompressSllz(wrapped.data(), wrapped.size(), out, outError);
  case Backend::Auto: break;
  }
  return Fail(outError, ErrorCode::BackendFailure, "unresolved backend");
}

} // namespace avfcomp
