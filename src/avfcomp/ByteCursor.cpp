#include "avfcomp/ByteCursor.hpp"

#include <algorithm>
#include <cstring>

namespace avfcomp {

ByteReader::ByteReader(const std::uint8_t* data, std::size_t size, ErrorCode truncatedCode)
    : m_data(data)
    , m_size(data ? size : 0)
    , m_truncatedCode(truncatedCode)
{
}

ByteReader::ByteReader(const std::vector<std::uint8_t>& bytes, ErrorCode truncatedCode)
    : ByteReader(bytes.data(), bytes.size(), truncatedCode)
{
}

bool ByteReader::truncated(CodecError& outError, const char* what) const
{
  std::string msg = "unexpected end of data while reading ";
  msg += what ? what : "field";
  msg += " (offset ";
  msg += std::to_string(m_pos);
  msg += ")";
  return Fail(outError, m_truncatedCode, std::move(msg));
}

bool ByteReader::readU8(std::uint8_t& out, CodecError& outError, const char* what)
{
  if (m_pos >= m_size) return truncated(outError, what);
  out = m_data[m_pos++];
  return true;
}

bool ByteReader::readU16BE(std::uint16_t& out, CodecError& outError, const char* what)
{
  if (remaining() < 2) return truncated(outError, what);
  out = static_cast<std::uint16_t>((static_cast<std::uint16_t>(m_data[m_pos]) << 8) | m_data[m_pos + 1]);
  m_pos += 2;
  return true;
}

bool ByteReader::readU24BE(std::uint32_t& out, CodecError& outError, const char* what)
{
  if (remaining() < 3) return truncated(outError, what);
  out = (static_cast<std::uint32_t>(m_data[m_pos]) << 16) | (static_cast<std::uint32_t>(m_data[m_pos + 1]) << 8) |
        static_cast<std::uint32_t>(m_data[m_pos + 2]);
  m_pos += 3;
  return true;
}

bool ByteReader::readBytes(std::size_t n, std::vector<std::uint8_t>& out, CodecError& outError, const char* what)
{
  if (remaining() < n) return truncated(outError, what);
  out.insert(out.end(), m_data + m_pos, m_data + m_pos + n);
  m_pos += n;
  return true;
}

bool ByteReader::readBytes(std::size_t n, std::uint8_t* out, CodecError& outError, const char* what)
{
  if (remaining() < n) return truncated(outError, what);
  if (n > 0) std::memcpy(out, m_data + m_pos, n);
  m_pos += n;
  return true;
}

void ByteReader::readRest(std::vector<std::uint8_t>& out)
{
  out.insert(out.end(), m_data + m_pos, m_data + m_size);
  m_pos = m_size;
}

bool ByteReader::seekBack(std::size_t n, CodecError& outError)
{
  if (n > m_pos) {
    return Fail(outError, m_truncatedCode,
                "cannot seek back " + std::to_string(n) + " bytes from offset " + std::to_string(m_pos));
  }
  m_pos -= n;
  return true;
}

bool ByteReader::skip(std::size_t n, CodecError& outError, const char* what)
{
  if (remaining() < n) return truncated(outError, what);
  m_pos += n;
  return true;
}

bool ScanUntilByte(ByteReader& in, std::uint8_t delim, std::vector<std::uint8_t>& out, CodecError& outError,
                   const char* what)
{
  const std::uint8_t* begin = in.data() + in.position();
  const void* hit = std::memchr(begin, delim, in.remaining());
  if (!hit) {
    (void)in.skip(in.remaining(), outError, what);
    return in.truncated(outError, what);
  }

  const std::size_t len = static_cast<std::size_t>(static_cast<const std::uint8_t*>(hit) - begin);
  out.insert(out.end(), begin, begin + len);
  return in.skip(len + 1, outError, what);
}

bool ScanEventStart(ByteReader& in, std::vector<std::uint8_t>& out, CodecError& outError)
{
  const std::uint8_t* p = in.data() + in.position();
  const std::size_t n = in.remaining();
  if (n == 0) return in.truncated(outError, "event start");

  std::uint8_t last = p[0];
  for (std::size_t i = 1; i < n; ++i) {
    const std::uint8_t cur = p[i];
    if (last <= 1 && cur == 1) {
      out.insert(out.end(), p, p + i);
      return in.skip(i + 1, outError, "event start");
    }
    last = cur;
  }

  (void)in.skip(n, outError, "event start");
  return in.truncated(outError, "event start");
}

bool ScanThroughMarker(ByteReader& in, const std::string& marker, std::vector<std::uint8_t>& out,
                       CodecError& outError, const char* what)
{
  const std::uint8_t* begin = in.data() + in.position();
  const std::uint8_t* end = begin + in.remaining();
  const std::uint8_t* hit = std::search(begin, end, marker.begin(), marker.end(),
                                        [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); });
  if (marker.empty() || hit == end) {
    (void)in.skip(in.remaining(), outError, what);
    return in.truncated(outError, what);
  }

  const std::size_t len = static_cast<std::size_t>(hit - begin) + marker.size();
  out.insert(out.end(), begin, begin + len);
  return in.skip(len, outError, what);
}

} // namespace avfcomp
