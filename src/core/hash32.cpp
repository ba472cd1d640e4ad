#include "kvframe/hash32.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace kvframe {
namespace {

constexpr std::uint32_t kFnvOffsetBasis = 0x811C9DC5U;
constexpr std::uint32_t kFnvPrime = 16777619U;
constexpr std::uint32_t kCrc32Polynomial = 0xEDB88320U;  // IEEE 802.3, reflected
constexpr std::uint32_t kAdlerModulus = 65521U;
// Largest n such that 255n(n+1)/2 + (n+1)(kAdlerModulus-1) fits in 32 bits.
constexpr std::size_t kAdlerBlock = 5552;

constexpr std::array<std::uint32_t, 256> BuildCrc32Table() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < table.size(); ++i) {
    std::uint32_t crc = i;
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc >> 1U) ^ ((crc & 1U) != 0U ? kCrc32Polynomial : 0U);
    }
    table[i] = crc;
  }
  return table;
}

constexpr std::array<std::uint32_t, 256> kCrc32Table = BuildCrc32Table();

}  // namespace

std::array<std::byte, kDigestSize> Hash32::Finalize() const {
  const std::uint32_t sum = Sum32();
  return {
      static_cast<std::byte>((sum >> 24U) & 0xFFU),
      static_cast<std::byte>((sum >> 16U) & 0xFFU),
      static_cast<std::byte>((sum >> 8U) & 0xFFU),
      static_cast<std::byte>(sum & 0xFFU),
  };
}

void Fnv1a32::Reset() noexcept {
  state_ = kFnvOffsetBasis;
}

void Fnv1a32::Update(std::span<const std::byte> bytes) {
  for (const std::byte value : bytes) {
    state_ ^= std::to_integer<std::uint32_t>(value);
    state_ *= kFnvPrime;
  }
}

void Crc32::Reset() noexcept {
  register_ = 0xFFFFFFFFU;
}

void Crc32::Update(std::span<const std::byte> bytes) {
  for (const std::byte value : bytes) {
    register_ = kCrc32Table[(register_ ^ std::to_integer<std::uint32_t>(value)) & 0xFFU] ^ (register_ >> 8U);
  }
}

void Adler32::Reset() noexcept {
  a_ = 1;
  b_ = 0;
}

void Adler32::Update(std::span<const std::byte> bytes) {
  while (!bytes.empty()) {
    const std::size_t count = bytes.size() < kAdlerBlock ? bytes.size() : kAdlerBlock;
    for (const std::byte value : bytes.first(count)) {
      a_ += std::to_integer<std::uint32_t>(value);
      b_ += a_;
    }
    a_ %= kAdlerModulus;
    b_ %= kAdlerModulus;
    bytes = bytes.subspan(count);
  }
}

std::unique_ptr<Hash32> MakeHash32(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::kNone:
      return nullptr;
    case ChecksumAlgorithm::kFnv1a32:
      return std::make_unique<Fnv1a32>();
    case ChecksumAlgorithm::kCrc32:
      return std::make_unique<Crc32>();
    case ChecksumAlgorithm::kAdler32:
      return std::make_unique<Adler32>();
  }
  throw std::invalid_argument("unknown checksum algorithm: " + std::to_string(static_cast<int>(algorithm)));
}

const char* ChecksumAlgorithmName(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::kNone:
      return "none";
    case ChecksumAlgorithm::kFnv1a32:
      return "fnv1a32";
    case ChecksumAlgorithm::kCrc32:
      return "crc32";
    case ChecksumAlgorithm::kAdler32:
      return "adler32";
  }
  return "unknown";
}

std::optional<ChecksumAlgorithm> ParseChecksumAlgorithm(std::string_view name) {
  if (name == "none") {
    return ChecksumAlgorithm::kNone;
  }
  if (name == "fnv1a32") {
    return ChecksumAlgorithm::kFnv1a32;
  }
  if (name == "crc32") {
    return ChecksumAlgorithm::kCrc32;
  }
  if (name == "adler32") {
    return ChecksumAlgorithm::kAdler32;
  }
  return std::nullopt;
}

}  // namespace kvframe
