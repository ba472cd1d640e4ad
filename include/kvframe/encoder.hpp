#pragma once

#include "kvframe/byte_stream.hpp"
#include "kvframe/errors.hpp"
#include "kvframe/hash32.hpp"
#include "kvframe/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>

namespace kvframe {

// Transmits key-value records on a ByteSink. A record with a key of at most
// 511 bytes and a value of at most 4 GiB - 1 is framed as:
//
//   - 2 bytes of header: value length width (2 bits), checksum flag (1 bit),
//     extension tag (4 bits) and key length (9 bits),
//   - 1 to 4 bytes holding the value length,
//   - the key and value bytes, uninterpreted,
//   - a 4 byte digest of key + value when a hasher is configured.
//
// Per-frame overhead is 3 to 10 bytes. Encode calls from several threads are
// serialized so that frames never interleave on the sink.
class Encoder {
 public:
  explicit Encoder(ByteSink& sink, std::unique_ptr<Hash32> hasher = nullptr);
  Encoder(ByteSink& sink, const CodecConfig& config);

  Encoder(const Encoder&) = delete;
  Encoder& operator=(const Encoder&) = delete;

  void Encode(std::span<const std::byte> key, std::span<const std::byte> value);
  void EncodeTagged(std::span<const std::byte> key, std::span<const std::byte> value, ExtensionTag tag);

  [[nodiscard]] bool checksum_enabled() const { return hasher_ != nullptr; }

 private:
  void WriteHeader(std::size_t key_length, std::uint8_t width, ExtensionTag tag);
  void WriteValueLength(std::size_t value_length, std::uint8_t width);
  void WriteChecksum(std::span<const std::byte> key, std::span<const std::byte> value);
  void WriteField(std::span<const std::byte> bytes, Phase phase);

  ByteSink& sink_;
  std::unique_ptr<Hash32> hasher_;
  std::mutex mutex_{};
};

}  // namespace kvframe
