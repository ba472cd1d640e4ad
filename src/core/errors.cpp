#include "kvframe/errors.hpp"

namespace kvframe {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kKeyTooLong:
      return "key too long";
    case ErrorKind::kValueTooLong:
      return "value too long";
    case ErrorKind::kTagOutOfRange:
      return "tag out of range";
    case ErrorKind::kEndOfStream:
      return "end of stream";
    case ErrorKind::kTruncatedStream:
      return "truncated stream";
    case ErrorKind::kChecksumMismatch:
      return "checksum mismatch";
    case ErrorKind::kIo:
      return "io failure";
  }
  return "unknown";
}

const char* PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kValidate:
      return "validate";
    case Phase::kHeader:
      return "header";
    case Phase::kValueLength:
      return "value length";
    case Phase::kKey:
      return "key";
    case Phase::kValue:
      return "value";
    case Phase::kChecksum:
      return "checksum";
  }
  return "unknown";
}

CodecError::CodecError(ErrorKind kind,
                       Phase phase,
                       const std::string& message,
                       std::uint64_t expected,
                       std::uint64_t actual)
    : std::runtime_error(message), kind_(kind), phase_(phase), expected_(expected), actual_(actual) {}

bool CodecError::IsInputTooLarge() const noexcept {
  return kind_ == ErrorKind::kKeyTooLong || kind_ == ErrorKind::kValueTooLong ||
         kind_ == ErrorKind::kTagOutOfRange;
}

}  // namespace kvframe
