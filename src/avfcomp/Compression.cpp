#include "avfcomp/Compression.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

namespace avfcomp {

namespace {

constexpr std::size_t kMaxLiteralRun = 128;
constexpr std::size_t kMinCopy = 4;
constexpr std::size_t kMaxCopy = 130;
constexpr std::size_t kMaxOffset = std::numeric_limits<std::uint16_t>::max();
constexpr std::size_t kHashBits = 16;

// Replays repeat short byte patterns (event records, bitmap rows), so a
// single-candidate hash chain over 3-byte prefixes finds most matches.
inline std::uint32_t HashPrefix(const std::uint8_t* p)
{
  std::uint32_t v = (static_cast<std::uint32_t>(p[0]) << 16) | (static_cast<std::uint32_t>(p[1]) << 8) | p[2];
  v *= 2654435761u;
  return v >> (32 - kHashBits);
}

void PutLiterals(std::vector<std::uint8_t>& out, const std::uint8_t* p, std::size_t n)
{
  while (n > 0) {
    const std::size_t run = std::min(n, kMaxLiteralRun);
    out.push_back(static_cast<std::uint8_t>(run - 1));
    out.insert(out.end(), p, p + run);
    p += run;
    n -= run;
  }
}

void PutCopy(std::vector<std::uint8_t>& out, std::size_t offset, std::size_t n)
{
  while (n > 0) {
    // Never leave a tail shorter than the minimum copy.
    std::size_t len = std::min(n, kMaxCopy);
    if (n - len > 0 && n - len < 3) len = n - 3;
    out.push_back(static_cast<std::uint8_t>(0x80u | (len - 3)));
    out.push_back(static_cast<std::uint8_t>(offset & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((offset >> 8) & 0xFFu));
    n -= len;
  }
}

} // namespace

bool HasSllzMagic(const std::uint8_t* data, std::size_t size)
{
  return data && size >= kSllzHeaderSize && std::memcmp(data, kSllzMagic, sizeof(kSllzMagic)) == 0;
}

void CompressSllz(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out)
{
  out.clear();
  out.insert(out.end(), kSllzMagic, kSllzMagic + sizeof(kSllzMagic));
  const std::uint32_t sz = static_cast<std::uint32_t>(size);
  out.push_back(static_cast<std::uint8_t>(sz >> 24));
  out.push_back(static_cast<std::uint8_t>(sz >> 16));
  out.push_back(static_cast<std::uint8_t>(sz >> 8));
  out.push_back(static_cast<std::uint8_t>(sz));
  if (!data || size == 0) return;

  std::vector<std::int64_t> head(std::size_t{1} << kHashBits, -1);

  std::size_t pos = 0;
  std::size_t literalStart = 0;
  while (pos + 3 <= size) {
    const std::uint32_t h = HashPrefix(data + pos);
    const std::int64_t cand = head[h];
    head[h] = static_cast<std::int64_t>(pos);

    std::size_t len = 0;
    std::size_t offset = 0;
    if (cand >= 0) {
      offset = pos - static_cast<std::size_t>(cand);
      if (offset <= kMaxOffset) {
        const std::size_t limit = std::min(kMaxCopy, size - pos);
        const std::uint8_t* a = data + static_cast<std::size_t>(cand);
        const std::uint8_t* b = data + pos;
        while (len < limit && a[len] == b[len]) ++len;
      }
    }

    if (len < kMinCopy) {
      ++pos;
      continue;
    }

    PutLiterals(out, data + literalStart, pos - literalStart);
    PutCopy(out, offset, len);

    for (std::size_t k = 1; k < len && pos + k + 3 <= size; ++k) {
      head[HashPrefix(data + pos + k)] = static_cast<std::int64_t>(pos + k);
    }
    pos += len;
    literalStart = pos;
  }

  PutLiterals(out, data + literalStart, size - literalStart);
}

bool DecompressSllz(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out,
                    CodecError& outError)
{
  out.clear();
  if (!HasSllzMagic(data, size)) {
    return Fail(outError, ErrorCode::BackendFailure, "missing SLLZ frame header");
  }

  const std::size_t expected = (static_cast<std::size_t>(data[4]) << 24) | (static_cast<std::size_t>(data[5]) << 16) |
                               (static_cast<std::size_t>(data[6]) << 8) | static_cast<std::size_t>(data[7]);

  // The densest command is a 3-byte copy of kMaxCopy bytes, so the body bounds
  // the output; a header claiming more is corrupt.
  const std::size_t maxOutput = (size - kSllzHeaderSize) / 3u * kMaxCopy;
  if (expected > maxOutput) {
    return Fail(outError, ErrorCode::BackendFailure,
                "SLLZ frame declares " + std::to_string(expected) + " bytes but its body can hold at most " +
                    std::to_string(maxOutput));
  }
  out.reserve(expected);

  std::size_t i = kSllzHeaderSize;
  while (i < size) {
    const std::uint8_t tag = data[i++];
    if ((tag & 0x80u) == 0u) {
      const std::size_t len = static_cast<std::size_t>(tag) + 1u;
      if (size - i < len || out.size() + len > expected) {
        return Fail(outError, ErrorCode::BackendFailure, "SLLZ literal run overruns the frame");
      }
      out.insert(out.end(), data + i, data + i + len);
      i += len;
      continue;
    }

    const std::size_t len = static_cast<std::size_t>(tag & 0x7Fu) + 3u;
    if (size - i < 2) {
      return Fail(outError, ErrorCode::BackendFailure, "SLLZ copy command is truncated");
    }
    const std::size_t offset = static_cast<std::size_t>(data[i]) | (static_cast<std::size_t>(data[i + 1]) << 8);
    i += 2;
    if (offset == 0 || offset > out.size() || out.size() + len > expected) {
      return Fail(outError, ErrorCode::BackendFailure,
                  "SLLZ copy (offset " + std::to_string(offset) + ", length " + std::to_string(len) +
                      ") is out of bounds");
    }
    const std::size_t src = out.size() - offset;
    for (std::size_t k = 0; k < len; ++k) {
      out.push_back(out[src + k]);
    }
  }

  if (out.size() != expected) {
    return Fail(outError, ErrorCode::BackendFailure,
                "SLLZ frame decoded to " + std::to_string(out.size()) + " bytes, expected " +
                    std::to_string(expected));
  }
  return true;
}

} // namespace avfcomp
