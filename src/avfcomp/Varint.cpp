#include "avfcomp/Varint.hpp"

#include <string>

namespace avfcomp {

bool AppendVarint(std::vector<std::uint8_t>& out, std::uint32_t v, CodecError& outError)
{
  if (v < 0x80u) {
    out.push_back(static_cast<std::uint8_t>(v));
    return true;
  }
  if (v < kVarintLimit) {
    out.push_back(static_cast<std::uint8_t>(0x80u | (v >> 8)));
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    return true;
  }
  return Fail(outError, ErrorCode::ValueTooLarge,
              "residual value " + std::to_string(v) + " does not fit in a 2-byte varint");
}

bool EncodeVarints(const std::vector<std::uint32_t>& values, std::vector<std::uint8_t>& out, CodecError& outError)
{
  out.reserve(out.size() + values.size());
  for (std::uint32_t v : values) {
    if (!AppendVarint(out, v, outError)) return false;
  }
  return true;
}

bool DecodeVarints(const std::uint8_t* data, std::size_t size, std::vector<std::uint32_t>& out,
                   CodecError& outError)
{
  out.clear();
  out.reserve(size);

  std::size_t i = 0;
  while (i < size) {
    const std::uint8_t b0 = data[i];
    if ((b0 & 0x80u) == 0u) {
      out.push_back(b0);
      ++i;
      continue;
    }
    if (i + 1 >= size) {
      return Fail(outError, ErrorCode::TruncatedBlock,
                  "2-byte varint at residual offset " + std::to_string(i) + " is missing its second byte");
    }
    out.push_back((static_cast<std::uint32_t>(b0 & 0x7Fu) << 8) | data[i + 1]);
    i += 2;
  }
  return true;
}

} // namespace avfcomp
