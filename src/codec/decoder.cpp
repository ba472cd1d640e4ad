#include "kvframe/decoder.hpp"

#include "../core/frame_format.hpp"
#include "../core/scoped_hash_reset.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <string>
#include <utility>

namespace kvframe {
namespace {

namespace frame = core::frame;

// Variable-length fields grow by at most this much per read, so a corrupt
// length cannot commit memory ahead of the bytes actually received.
constexpr std::size_t kReadChunk = 64U * 1024U;

std::string DecodeMessage(const std::string& detail) {
  return "could not decode record: " + detail;
}

CodecError DecodeIoError(Phase phase, const std::exception& cause) {
  return CodecError(ErrorKind::kIo,
                    phase,
                    DecodeMessage(std::string("reading ") + PhaseName(phase) + ": " + cause.what()));
}

CodecError TruncatedError(Phase phase, std::uint64_t expected, std::uint64_t actual) {
  return CodecError(ErrorKind::kTruncatedStream,
                    phase,
                    DecodeMessage(std::string("unexpected end of stream reading ") + PhaseName(phase) + ": expected " +
                                  std::to_string(expected) + " bytes, got " + std::to_string(actual)),
                    expected,
                    actual);
}

std::string HexDigest(std::span<const std::byte> digest) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2);
  for (const std::byte value : digest) {
    const auto octet = std::to_integer<unsigned>(value);
    out.push_back(kHex[octet >> 4U]);
    out.push_back(kHex[octet & 0x0FU]);
  }
  return out;
}

}  // namespace

Decoder::Decoder(ByteSource& source, std::unique_ptr<Hash32> hasher)
    : source_(source), hasher_(std::move(hasher)) {}

Decoder::Decoder(ByteSource& source, const CodecConfig& config) : Decoder(source, MakeHash32(config.checksum)) {}

Record Decoder::Decode() {
  auto tagged = DecodeTagged();
  return Record{std::move(tagged.key), std::move(tagged.value)};
}

TaggedRecord Decoder::DecodeTagged() {
  std::lock_guard<std::mutex> lock(mutex_);
  return DecodeFrame();
}

std::optional<Record> Decoder::TryDecode() {
  auto tagged = TryDecodeTagged();
  if (!tagged.has_value()) {
    return std::nullopt;
  }
  return Record{std::move(tagged->key), std::move(tagged->value)};
}

std::optional<TaggedRecord> Decoder::TryDecodeTagged() {
  try {
    return DecodeTagged();
  } catch (const CodecError& ex) {
    if (ex.IsEndOfStream()) {
      return std::nullopt;
    }
    throw;
  }
}

TaggedRecord Decoder::DecodeFrame() {
  std::array<std::byte, frame::kHeaderSize> header_bytes{};
  const std::size_t got = ReadAvailable(header_bytes, Phase::kHeader);
  if (got == 0) {
    throw CodecError(ErrorKind::kEndOfStream, Phase::kHeader, DecodeMessage("end of stream"));
  }
  if (got != header_bytes.size()) {
    throw TruncatedError(Phase::kHeader, header_bytes.size(), got);
  }
  const frame::FrameHeader header = frame::UnpackHeader(frame::DecodeHeaderBytes(header_bytes));

  std::array<std::byte, frame::kMaxWidth> length_bytes{};
  const auto length_field = std::span<std::byte>(length_bytes).first(header.width);
  ReadField(length_field, Phase::kValueLength);
  const std::uint32_t value_length = frame::DecodeValueLength(length_field);

  TaggedRecord record{};
  record.tag = header.tag;
  ReadGrowing(record.key, header.key_length, Phase::kKey);
  ReadGrowing(record.value, value_length, Phase::kValue);

  if (header.checksummed) {
    VerifyChecksum(record.key, record.value);
  }
  return record;
}

std::size_t Decoder::ReadFully(std::span<std::byte> buffer) {
  std::size_t total = 0;
  while (total < buffer.size()) {
    const std::size_t got = source_.Read(buffer.subspan(total));
    if (got == 0) {
      break;
    }
    total += got;
  }
  return total;
}

std::size_t Decoder::ReadAvailable(std::span<std::byte> buffer, Phase phase) {
  try {
    return ReadFully(buffer);
  } catch (const CodecError&) {
    throw;
  } catch (const std::exception& ex) {
    throw DecodeIoError(phase, ex);
  }
}

void Decoder::ReadField(std::span<std::byte> buffer, Phase phase) {
  const std::size_t got = ReadAvailable(buffer, phase);
  if (got != buffer.size()) {
    throw TruncatedError(phase, buffer.size(), got);
  }
}

void Decoder::ReadGrowing(std::vector<std::byte>& out, std::size_t length, Phase phase) {
  out.clear();
  while (out.size() < length) {
    const std::size_t offset = out.size();
    const std::size_t step = std::min(kReadChunk, length - offset);
    out.resize(offset + step);
    const std::size_t got = ReadAvailable(std::span<std::byte>(out).subspan(offset), phase);
    if (got != step) {
      throw TruncatedError(phase, length, offset + got);
    }
  }
}

void Decoder::VerifyChecksum(std::span<const std::byte> key, std::span<const std::byte> value) {
  std::array<std::byte, frame::kChecksumSize> observed{};
  ReadField(observed, Phase::kChecksum);
  if (hasher_ == nullptr) {
    return;
  }

  core::ScopedHashReset reset(*hasher_);
  hasher_->Update(key);
  hasher_->Update(value);
  const auto computed = hasher_->Finalize();
  if (computed != observed) {
    throw CodecError(ErrorKind::kChecksumMismatch,
                     Phase::kChecksum,
                     DecodeMessage(std::string("computed ") + hasher_->name() + " checksum " + HexDigest(computed) +
                                   " does not match observed " + HexDigest(observed)));
  }
}

}  // namespace kvframe
