#include "kvframe/byte_stream.hpp"
#include "kvframe/decoder.hpp"
#include "kvframe/encoder.hpp"
#include "kvframe/types.hpp"

#include "../test_logger.hpp"

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>

int main() {
  kvframe::tests::Log("smoke_test: start");
  const kvframe::CodecConfig config;
  if (config.checksum != kvframe::ChecksumAlgorithm::kNone) {
    std::cerr << "checksum default mismatch\n";
    return EXIT_FAILURE;
  }

  kvframe::ByteBuffer buffer;
  kvframe::Encoder encoder(buffer, config);
  kvframe::Decoder decoder(buffer, config);
  if (encoder.checksum_enabled() || decoder.checksum_enabled()) {
    std::cerr << "default config must not enable checksums\n";
    return EXIT_FAILURE;
  }

  kvframe::CodecConfig summed;
  summed.checksum = kvframe::ChecksumAlgorithm::kCrc32;
  kvframe::Encoder summed_encoder(buffer, summed);
  if (!summed_encoder.checksum_enabled()) {
    std::cerr << "crc32 config must enable checksums\n";
    return EXIT_FAILURE;
  }

  try {
    encoder.Encode(std::span<const std::byte>(), std::span<const std::byte>());
    summed_encoder.Encode(std::span<const std::byte>(), std::span<const std::byte>());
    const auto plain = decoder.TryDecode();
    const auto checked = decoder.TryDecode();
    if (!plain.has_value() || !checked.has_value() || decoder.TryDecode().has_value()) {
      std::cerr << "expected exactly two empty records\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    kvframe::tests::LogError(ex.what());
    std::cerr << "smoke round trip failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  kvframe::tests::Log("smoke_test: finished");
  std::cout << "kvframe smoke test passed\n";
  return EXIT_SUCCESS;
}
