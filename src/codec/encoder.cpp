#include "kvframe/encoder.hpp"

#include "../core/frame_format.hpp"
#include "../core/scoped_hash_reset.hpp"
#include "kvframe/errors.hpp"

#include <exception>
#include <string>
#include <utility>

namespace kvframe {
namespace {

namespace frame = core::frame;

CodecError EncodeIoError(Phase phase, const std::exception& cause) {
  return CodecError(ErrorKind::kIo,
                    phase,
                    std::string("could not encode record: writing ") + PhaseName(phase) + ": " + cause.what());
}

}  // namespace

Encoder::Encoder(ByteSink& sink, std::unique_ptr<Hash32> hasher) : sink_(sink), hasher_(std::move(hasher)) {}

Encoder::Encoder(ByteSink& sink, const CodecConfig& config) : Encoder(sink, MakeHash32(config.checksum)) {}

void Encoder::Encode(std::span<const std::byte> key, std::span<const std::byte> value) {
  EncodeTagged(key, value, ExtensionTag::k0);
}

void Encoder::EncodeTagged(std::span<const std::byte> key, std::span<const std::byte> value, ExtensionTag tag) {
  frame::ValidateRecordSize(key.size(), value.size());
  frame::ValidateTag(tag);
  const std::uint8_t width = frame::WidthOf(value.size());

  std::lock_guard<std::mutex> lock(mutex_);
  WriteHeader(key.size(), width, tag);
  WriteValueLength(value.size(), width);
  WriteField(key, Phase::kKey);
  WriteField(value, Phase::kValue);
  if (hasher_ == nullptr) {
    return;
  }
  WriteChecksum(key, value);
}

void Encoder::WriteHeader(std::size_t key_length, std::uint8_t width, ExtensionTag tag) {
  frame::FrameHeader header{};
  header.width = width;
  header.checksummed = hasher_ != nullptr;
  header.tag = tag;
  header.key_length = static_cast<std::uint16_t>(key_length);
  const auto bytes = frame::EncodeHeaderBytes(frame::PackHeader(header));
  WriteField(bytes, Phase::kHeader);
}

void Encoder::WriteValueLength(std::size_t value_length, std::uint8_t width) {
  const auto bytes = frame::EncodeValueLength(value_length, width);
  WriteField(std::span<const std::byte>(bytes).first(width), Phase::kValueLength);
}

void Encoder::WriteChecksum(std::span<const std::byte> key, std::span<const std::byte> value) {
  core::ScopedHashReset reset(*hasher_);
  hasher_->Update(key);
  hasher_->Update(value);
  const auto digest = hasher_->Finalize();
  WriteField(digest, Phase::kChecksum);
}

void Encoder::WriteField(std::span<const std::byte> bytes, Phase phase) {
  if (bytes.empty()) {
    return;
  }
  try {
    sink_.Write(bytes);
  } catch (const CodecError&) {
    throw;
  } catch (const std::exception& ex) {
    throw EncodeIoError(phase, ex);
  }
}

}  // namespace kvframe
