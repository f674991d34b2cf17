#include "avfcomp/Errors.hpp"

#include <utility>

namespace avfcomp {

ErrorCategory CategoryOf(ErrorCode code)
{
  switch (code) {
  case ErrorCode::None: return ErrorCategory::None;
  case ErrorCode::InvalidLevel:
  case ErrorCode::Truncated:
  case ErrorCode::UnknownEventType:
  case ErrorCode::MalformedFooter: return ErrorCategory::Format;
  case ErrorCode::ValueTooLarge: return ErrorCategory::Compression;
  case ErrorCode::TruncatedBlock:
  case ErrorCode::UnknownOpcode: return ErrorCategory::Decode;
  case ErrorCode::BackendFailure: return ErrorCategory::Backend;
  case ErrorCode::IoFailure:
  case ErrorCode::RoundTripMismatch: return ErrorCategory::Io;
  }
  return ErrorCategory::None;
}

const char* ErrorCodeName(ErrorCode code)
{
  switch (code) {
  case ErrorCode::None: return "None";
  case ErrorCode::InvalidLevel: return "InvalidLevel";
  case ErrorCode::Truncated: return "Truncated";
  case ErrorCode::UnknownEventType: return "UnknownEventType";
  case ErrorCode::MalformedFooter: return "MalformedFooter";
  case ErrorCode::ValueTooLarge: return "ValueTooLarge";
  case ErrorCode::TruncatedBlock: return "TruncatedBlock";
  case ErrorCode::UnknownOpcode: return "UnknownOpcode";
  case ErrorCode::BackendFailure: return "BackendFailure";
  case ErrorCode::IoFailure: return "IoFailure";
  case ErrorCode::RoundTripMismatch: return "RoundTripMismatch";
  }
  return "Unknown";
}

const char* ErrorCategoryName(ErrorCategory category)
{
  switch (category) {
  case ErrorCategory::None: return "None";
  case ErrorCategory::Format: return "FormatError";
  case ErrorCategory::Compression: return "CompressionError";
  case ErrorCategory::Decode: return "DecodeError";
  case ErrorCategory::Backend: return "BackendError";
  case ErrorCategory::Io: return "IoError";
  }
  return "Unknown";
}

std::string DescribeError(const CodecError& err)
{
  std::string s = ErrorCategoryName(CategoryOf(err.code));
  s += "::";
  s += ErrorCodeName(err.code);
  if (!err.message.empty()) {
    s += ": ";
    s += err.message;
  }
  return s;
}

bool Fail(CodecError& outError, ErrorCode code, std::string message)
{
  outError.code = code;
  outError.message = std::move(message);
  return false;
}

} // namespace avfcomp
