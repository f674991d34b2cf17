#pragma once

#include <cstdint>
#include <string>

namespace avfcomp {

// Error codes for the codec. Every failure is terminal for the file being
// processed: the first error is reported and no partial output is produced.
enum class ErrorCode : std::uint8_t {
  None = 0,

  // FormatError: AVF parsing.
  InvalidLevel,
  Truncated,
  UnknownEventType,
  MalformedFooter,

  // CompressionError: event block encoding.
  ValueTooLarge,

  // DecodeError: CVF parsing.
  TruncatedBlock,
  UnknownOpcode,

  // BackendError: outer stream wrapping.
  BackendFailure,

  // IoError: file access and post-compression verification.
  IoFailure,
  RoundTripMismatch,
};

enum class ErrorCategory : std::uint8_t {
  None = 0,
  Format,
  Compression,
  Decode,
  Backend,
  Io,
};

struct CodecError {
  ErrorCode code = ErrorCode::None;
  std::string message;

  bool ok() const { return code == ErrorCode::None; }
  void clear()
  {
    code = ErrorCode::None;
    message.clear();
  }
};

ErrorCategory CategoryOf(ErrorCode code);

const char* ErrorCodeName(ErrorCode code);
const char* ErrorCategoryName(ErrorCategory category);

// "FormatError::Truncated: <message>"
std::string DescribeError(const CodecError& err);

// Fill `outError` and return false, so parsers can write `return Fail(...)`.
bool Fail(CodecError& outError, ErrorCode code, std::string message);

} // namespace avfcomp
