#pragma once

#include "kvframe/byte_stream.hpp"
#include "kvframe/errors.hpp"
#include "kvframe/hash32.hpp"
#include "kvframe/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace kvframe {

// Receives records framed by an Encoder. When a hasher is configured the
// trailing digest of every checksummed record is verified; otherwise the
// digest is skipped. Records without a digest are accepted either way.
//
// Decode throws CodecError with ErrorKind::kEndOfStream when the source is
// exhausted exactly at a frame boundary; TryDecode reports the same condition
// as std::nullopt. Calls from several threads are serialized per frame.
class Decoder {
 public:
  explicit Decoder(ByteSource& source, std::unique_ptr<Hash32> hasher = nullptr);
  Decoder(ByteSource& source, const CodecConfig& config);

  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  [[nodiscard]] Record Decode();
  [[nodiscard]] TaggedRecord DecodeTagged();
  [[nodiscard]] std::optional<Record> TryDecode();
  [[nodiscard]] std::optional<TaggedRecord> TryDecodeTagged();

  [[nodiscard]] bool checksum_enabled() const { return hasher_ != nullptr; }

 private:
  TaggedRecord DecodeFrame();
  std::size_t ReadFully(std::span<std::byte> buffer);
  std::size_t ReadAvailable(std::span<std::byte> buffer, Phase phase);
  void ReadField(std::span<std::byte> buffer, Phase phase);
  void ReadGrowing(std::vector<std::byte>& out, std::size_t length, Phase phase);
  void VerifyChecksum(std::span<const std::byte> key, std::span<const std::byte> value);

  ByteSource& source_;
  std::unique_ptr<Hash32> hasher_;
  std::mutex mutex_{};
};

}  // namespace kvframe
