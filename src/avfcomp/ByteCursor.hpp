#pragma once

#include "avfcomp/Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace avfcomp {

// Bounded reader over an in-memory byte span.
//
// The AVF layout is delimiter-driven rather than length-prefixed, so parsing is
// expressed as a cursor that moves forward through explicit scans and may step
// back by a few bytes. The reader never owns the bytes.
//
// Running past the end fills the CodecError with the code given at
// construction (Truncated for AVF input, TruncatedBlock for CVF input).
class ByteReader {
public:
  ByteReader(const std::uint8_t* data, std::size_t size, ErrorCode truncatedCode = ErrorCode::Truncated);
  explicit ByteReader(const std::vector<std::uint8_t>& bytes, ErrorCode truncatedCode = ErrorCode::Truncated);

  std::size_t position() const { return m_pos; }
  std::size_t size() const { return m_size; }
  std::size_t remaining() const { return m_size - m_pos; }
  bool atEnd() const { return m_pos >= m_size; }

  const std::uint8_t* data() const { return m_data; }
  ErrorCode truncatedCode() const { return m_truncatedCode; }

  bool readU8(std::uint8_t& out, CodecError& outError, const char* what);
  bool readU16BE(std::uint16_t& out, CodecError& outError, const char* what);
  bool readU24BE(std::uint32_t& out, CodecError& outError, const char* what);

  // Append `n` bytes to `out`.
  bool readBytes(std::size_t n, std::vector<std::uint8_t>& out, CodecError& outError, const char* what);
  bool readBytes(std::size_t n, std::uint8_t* out, CodecError& outError, const char* what);

  // Append everything up to the end of the span.
  void readRest(std::vector<std::uint8_t>& out);

  bool seekBack(std::size_t n, CodecError& outError);

  // Advance by `n` bytes that the caller already inspected through data().
  bool skip(std::size_t n, CodecError& outError, const char* what);

  bool truncated(CodecError& outError, const char* what) const;

private:
  const std::uint8_t* m_data = nullptr;
  std::size_t m_size = 0;
  std::size_t m_pos = 0;
  ErrorCode m_truncatedCode = ErrorCode::Truncated;
};

// Append bytes up to (not including) `delim`. The delimiter is consumed.
bool ScanUntilByte(ByteReader& in, std::uint8_t delim, std::vector<std::uint8_t>& out, CodecError& outError,
                   const char* what);

// Event-start heuristic.
//
// Reads one byte unconditionally, then keeps reading until the previous byte is
// <= 1 and the current byte is exactly 1. The collected bytes (excluding that
// final 1) are appended to `out`; the cursor is left just past the final 1.
//
// The very first byte is never tested as the terminating 1, only as "previous".
bool ScanEventStart(ByteReader& in, std::vector<std::uint8_t>& out, CodecError& outError);

// Append bytes through the first occurrence of `marker` that starts at or after
// the current position. The marker itself is appended too.
bool ScanThroughMarker(ByteReader& in, const std::string& marker, std::vector<std::uint8_t>& out,
                       CodecError& outError, const char* what);

// Big-endian append helpers.
inline void AppendU8(std::vector<std::uint8_t>& out, std::uint8_t v) { out.push_back(v); }

inline void AppendU16BE(std::vector<std::uint8_t>& out, std::uint16_t v)
{
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

inline void AppendU24BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

inline void AppendBytes(std::vector<std::uint8_t>& out, const std::vector<std::uint8_t>& bytes)
{
  out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void AppendBytes(std::vector<std::uint8_t>& out, const std::string& bytes)
{
  out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace avfcomp
