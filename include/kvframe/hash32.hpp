#pragma once

#include "kvframe/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace kvframe {

inline constexpr std::size_t kDigestSize = 4;

// Running 32-bit hash used for record checksums. Finalize() does not reset the
// accumulated state; callers reuse an instance by calling Reset().
class Hash32 {
 public:
  virtual ~Hash32() = default;

  virtual const char* name() const = 0;
  virtual void Reset() noexcept = 0;
  virtual void Update(std::span<const std::byte> bytes) = 0;
  virtual std::uint32_t Sum32() const = 0;

  // Big-endian digest of Sum32().
  [[nodiscard]] std::array<std::byte, kDigestSize> Finalize() const;
};

class Fnv1a32 final : public Hash32 {
 public:
  Fnv1a32() = default;

  const char* name() const override { return "fnv1a32"; }
  void Reset() noexcept override;
  void Update(std::span<const std::byte> bytes) override;
  std::uint32_t Sum32() const override { return state_; }

 private:
  std::uint32_t state_ = 0x811C9DC5U;
};

class Crc32 final : public Hash32 {
 public:
  Crc32() = default;

  const char* name() const override { return "crc32"; }
  void Reset() noexcept override;
  void Update(std::span<const std::byte> bytes) override;
  std::uint32_t Sum32() const override { return ~register_; }

 private:
  std::uint32_t register_ = 0xFFFFFFFFU;
};

class Adler32 final : public Hash32 {
 public:
  Adler32() = default;

  const char* name() const override { return "adler32"; }
  void Reset() noexcept override;
  void Update(std::span<const std::byte> bytes) override;
  std::uint32_t Sum32() const override { return (b_ << 16U) | a_; }

 private:
  std::uint32_t a_ = 1;
  std::uint32_t b_ = 0;
};

// Returns nullptr for ChecksumAlgorithm::kNone.
[[nodiscard]] std::unique_ptr<Hash32> MakeHash32(ChecksumAlgorithm algorithm);

[[nodiscard]] const char* ChecksumAlgorithmName(ChecksumAlgorithm algorithm);
[[nodiscard]] std::optional<ChecksumAlgorithm> ParseChecksumAlgorithm(std::string_view name);

}  // namespace kvframe
