#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kvframe {

// Extension tags carry caller-defined meaning and are transmitted alongside a
// record without being interpreted by the codec.
enum class ExtensionTag : std::uint8_t {
  k0 = 0x0,
  k1 = 0x1,
  k2 = 0x2,
  k3 = 0x3,
  k4 = 0x4,
  k5 = 0x5,
  k6 = 0x6,
  k7 = 0x7,
  k8 = 0x8,
  k9 = 0x9,
  kA = 0xA,
  kB = 0xB,
  kC = 0xC,
  kD = 0xD,
  kE = 0xE,
  kF = 0xF,
};

enum class ChecksumAlgorithm {
  kNone,
  kFnv1a32,
  kCrc32,
  kAdler32,
};

struct CodecConfig {
  ChecksumAlgorithm checksum = ChecksumAlgorithm::kNone;
};

struct Record {
  std::vector<std::byte> key;
  std::vector<std::byte> value;
};

struct TaggedRecord {
  std::vector<std::byte> key;
  std::vector<std::byte> value;
  ExtensionTag tag = ExtensionTag::k0;
};

}  // namespace kvframe
