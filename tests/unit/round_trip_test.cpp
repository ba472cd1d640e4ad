#include "kvframe/decoder.hpp"
#include "kvframe/encoder.hpp"

#include "kvframe/byte_stream.hpp"
#include "kvframe/errors.hpp"
#include "kvframe/hash32.hpp"
#include "../test_logger.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::vector<std::byte> Filled(std::size_t count, std::uint32_t seed) {
  std::vector<std::byte> out(count);
  std::uint32_t state = seed * 2654435761U + 1U;
  for (auto& value : out) {
    state = state * 1664525U + 1013904223U;
    value = static_cast<std::byte>(state >> 24U);
  }
  return out;
}

constexpr std::array<kvframe::ChecksumAlgorithm, 4> kAlgorithms = {
    kvframe::ChecksumAlgorithm::kNone,
    kvframe::ChecksumAlgorithm::kFnv1a32,
    kvframe::ChecksumAlgorithm::kCrc32,
    kvframe::ChecksumAlgorithm::kAdler32,
};

kvframe::CodecConfig ConfigFor(kvframe::ChecksumAlgorithm algorithm) {
  kvframe::CodecConfig config{};
  config.checksum = algorithm;
  return config;
}

void RunScenarioWidthBoundaries() {
  kvframe::tests::Log("scenario: round trip across value length widths");
  constexpr std::array<std::size_t, 7> kValueSizes = {0, 255, 256, 65'535, 65'536, 16'777'215, 16'777'216};
  constexpr std::array<std::size_t, 3> kKeySizes = {0, 37, 511};
  for (const auto algorithm : kAlgorithms) {
    const std::string name = kvframe::ChecksumAlgorithmName(algorithm);
    kvframe::ByteBuffer buffer;
    kvframe::Encoder encoder(buffer, ConfigFor(algorithm));
    kvframe::Decoder decoder(buffer, ConfigFor(algorithm));
    std::uint32_t seed = 0;
    for (const auto value_size : kValueSizes) {
      for (const auto key_size : kKeySizes) {
        ++seed;
        const auto key = Filled(key_size, seed);
        const auto value = Filled(value_size, seed + 1000);
        const auto tag = static_cast<kvframe::ExtensionTag>(seed % 16);
        encoder.EncodeTagged(key, value, tag);

        const std::size_t trailer = algorithm == kvframe::ChecksumAlgorithm::kNone ? 0 : 4;
        const std::size_t width = value_size < 256 ? 1 : value_size < 65'536 ? 2 : value_size < 16'777'216 ? 3 : 4;
        Require(buffer.size() == 2 + width + key_size + value_size + trailer,
                "unexpected frame size for " + name + " value size " + std::to_string(value_size));

        const auto record = decoder.DecodeTagged();
        Require(record.key == key, "key changed for " + name + " key size " + std::to_string(key_size));
        Require(record.value == value, "value changed for " + name + " value size " + std::to_string(value_size));
        Require(record.tag == tag, "tag changed for " + name);
        Require(buffer.empty(), "decoder must consume exactly one frame");
      }
    }
    kvframe::tests::LogKV(name, static_cast<std::uint64_t>(seed));
  }
}

void RunScenarioChecksumAsymmetry() {
  kvframe::tests::Log("scenario: readers and writers with different checksum settings");
  kvframe::ByteBuffer buffer;
  kvframe::Encoder plain(buffer);
  kvframe::Encoder summed(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kAdler32));
  const auto key = Filled(12, 1);
  const auto value = Filled(300, 2);
  plain.Encode(key, value);
  summed.Encode(key, value);
  plain.Encode(key, value);

  // A verifying reader accepts frames written without a digest.
  kvframe::Decoder verifying(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kAdler32));
  for (int i = 0; i < 3; ++i) {
    const auto record = verifying.Decode();
    Require(record.key == key && record.value == value, "verifying reader changed record " + std::to_string(i));
  }
  Require(!verifying.TryDecode().has_value(), "expected end of stream after three frames");

  summed.Encode(key, value);
  plain.Encode(key, value);
  kvframe::Decoder skipping(buffer);
  Require(skipping.Decode().value == value, "non-verifying reader must skip the digest");
  Require(skipping.Decode().value == value, "frame after a skipped digest changed");
  Require(!skipping.TryDecode().has_value(), "expected end of stream");
}

void RunScenarioEndOfStreamAfterFrames() {
  kvframe::tests::Log("scenario: end of stream after N frames");
  constexpr std::size_t kFrames = 25;
  kvframe::ByteBuffer buffer;
  kvframe::Encoder encoder(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kCrc32));
  for (std::size_t i = 0; i < kFrames; ++i) {
    encoder.Encode(Filled(i, static_cast<std::uint32_t>(i)), Filled(i * 13, static_cast<std::uint32_t>(i + 50)));
  }
  kvframe::Decoder decoder(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kCrc32));
  std::size_t decoded = 0;
  while (const auto record = decoder.TryDecode()) {
    Require(record->key.size() == decoded && record->value.size() == decoded * 13,
            "frame " + std::to_string(decoded) + " has unexpected sizes");
    ++decoded;
  }
  Require(decoded == kFrames, "expected every frame before end of stream");
  try {
    (void)decoder.Decode();
  } catch (const kvframe::CodecError& ex) {
    Require(ex.IsEndOfStream(), std::string("expected end of stream, got ") + ex.what());
    return;
  }
  throw std::runtime_error("Decode past the last frame must throw");
}

void RunScenarioIostreams() {
  kvframe::tests::Log("scenario: round trip through iostreams");
  std::stringstream stream(std::ios::in | std::ios::out | std::ios::binary);
  kvframe::OstreamSink sink(stream);
  kvframe::Encoder encoder(sink, std::make_unique<kvframe::Fnv1a32>());
  const auto key = Filled(64, 9);
  const auto value = Filled(70'000, 10);
  encoder.Encode(key, value);
  encoder.EncodeTagged(value, key, kvframe::ExtensionTag::k7);
  sink.Flush();

  kvframe::IstreamSource source(stream);
  kvframe::Decoder decoder(source, std::make_unique<kvframe::Fnv1a32>());
  const auto first = decoder.Decode();
  Require(first.key == key && first.value == value, "first record changed through iostreams");
  const auto second = decoder.DecodeTagged();
  Require(second.key == value && second.value == key, "second record changed through iostreams");
  Require(second.tag == kvframe::ExtensionTag::k7, "tag changed through iostreams");
  Require(!decoder.TryDecode().has_value(), "expected end of stream at the end of the iostream");
}

void RunScenarioConcurrentEncoders() {
  kvframe::tests::Log("scenario: concurrent encoders keep frames intact");
  constexpr std::size_t kThreads = 8;
  constexpr std::size_t kPerThread = 200;
  kvframe::ByteBuffer buffer;
  kvframe::Encoder encoder(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kFnv1a32));

  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (std::size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&encoder, t]() {
      for (std::size_t i = 0; i < kPerThread; ++i) {
        // Key holds the writer id and sequence; the value size varies per frame.
        const std::vector<std::byte> key = {static_cast<std::byte>(t),
                                            static_cast<std::byte>(i >> 8U),
                                            static_cast<std::byte>(i & 0xFFU)};
        encoder.Encode(key, Filled(1 + (i * 37) % 600, static_cast<std::uint32_t>(t * 1000 + i)));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  kvframe::Decoder decoder(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kFnv1a32));
  std::array<std::size_t, kThreads> next{};
  std::size_t total = 0;
  while (const auto record = decoder.TryDecode()) {
    Require(record->key.size() == 3, "unexpected key size");
    const auto t = std::to_integer<std::size_t>(record->key[0]);
    const auto i = (std::to_integer<std::size_t>(record->key[1]) << 8U) | std::to_integer<std::size_t>(record->key[2]);
    Require(t < kThreads, "unknown writer id");
    Require(i == next[t], "frames of writer " + std::to_string(t) + " out of order");
    Require(record->value == Filled(1 + (i * 37) % 600, static_cast<std::uint32_t>(t * 1000 + i)),
            "value of writer " + std::to_string(t) + " frame " + std::to_string(i) + " changed");
    ++next[t];
    ++total;
  }
  kvframe::tests::LogKV("frames", static_cast<std::uint64_t>(total));
  Require(total == kThreads * kPerThread, "expected every frame from every writer");
}

void RunScenarioConcurrentDecoders() {
  kvframe::tests::Log("scenario: concurrent decoders split the stream by whole frames");
  constexpr std::size_t kFrames = 1'000;
  constexpr std::size_t kThreads = 6;
  kvframe::ByteBuffer buffer;
  kvframe::Encoder encoder(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kCrc32));
  for (std::size_t i = 0; i < kFrames; ++i) {
    const std::vector<std::byte> key = {static_cast<std::byte>(i >> 8U), static_cast<std::byte>(i & 0xFFU)};
    encoder.Encode(key, Filled(i % 300, static_cast<std::uint32_t>(i)));
  }

  kvframe::Decoder decoder(buffer, ConfigFor(kvframe::ChecksumAlgorithm::kCrc32));
  std::mutex seen_mutex;
  std::vector<bool> seen(kFrames, false);
  std::vector<std::string> failures;
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (std::size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&]() {
      try {
        while (const auto record = decoder.TryDecode()) {
          const auto i = (std::to_integer<std::size_t>(record->key[0]) << 8U) |
                         std::to_integer<std::size_t>(record->key[1]);
          const bool intact = i < kFrames && record->value == Filled(i % 300, static_cast<std::uint32_t>(i));
          std::lock_guard<std::mutex> lock(seen_mutex);
          if (!intact || seen[i]) {
            failures.push_back("bad or duplicate frame " + std::to_string(i));
            return;
          }
          seen[i] = true;
        }
      } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        failures.push_back(ex.what());
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  Require(failures.empty(), failures.empty() ? std::string() : failures.front());
  for (std::size_t i = 0; i < kFrames; ++i) {
    Require(seen[i], "frame " + std::to_string(i) + " was never decoded");
  }
}

}  // namespace

int main() {
  try {
    kvframe::tests::Log("round_trip_test: start");
    RunScenarioWidthBoundaries();
    RunScenarioChecksumAsymmetry();
    RunScenarioEndOfStreamAfterFrames();
    RunScenarioIostreams();
    RunScenarioConcurrentEncoders();
    RunScenarioConcurrentDecoders();
    kvframe::tests::Log("round_trip_test: finished");
    std::cout << "round_trip_test passed\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    kvframe::tests::LogError(ex.what());
    std::cerr << "round_trip_test failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
