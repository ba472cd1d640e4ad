#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace kvframe {

enum class ErrorKind {
  kKeyTooLong,
  kValueTooLong,
  kTagOutOfRange,
  kEndOfStream,
  kTruncatedStream,
  kChecksumMismatch,
  kIo,
};

enum class Phase {
  kValidate,
  kHeader,
  kValueLength,
  kKey,
  kValue,
  kChecksum,
};

[[nodiscard]] const char* ErrorKindName(ErrorKind kind);
[[nodiscard]] const char* PhaseName(Phase phase);

// Raised by Encoder and Decoder. kind() identifies the failure, phase() the
// frame field being processed; expected()/actual() hold byte counts where they
// apply (limit vs. size for oversized input, declared vs. received for
// truncation).
class CodecError : public std::runtime_error {
 public:
  CodecError(ErrorKind kind,
             Phase phase,
             const std::string& message,
             std::uint64_t expected = 0,
             std::uint64_t actual = 0);

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] Phase phase() const noexcept { return phase_; }
  [[nodiscard]] std::uint64_t expected() const noexcept { return expected_; }
  [[nodiscard]] std::uint64_t actual() const noexcept { return actual_; }

  [[nodiscard]] bool IsEndOfStream() const noexcept { return kind_ == ErrorKind::kEndOfStream; }
  [[nodiscard]] bool IsInputTooLarge() const noexcept;

 private:
  ErrorKind kind_;
  Phase phase_;
  std::uint64_t expected_ = 0;
  std::uint64_t actual_ = 0;
};

}  // namespace kvframe
