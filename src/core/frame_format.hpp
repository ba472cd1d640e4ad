#pragma once

#include "kvframe/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace kvframe::core::frame {

//  1           0
//  5 4 3 2 1 0 9 8 7 6 5 4 3 2 1 0
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// | W |C|  Tag  |   Key length    |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
inline constexpr std::size_t kHeaderSize = 2;
inline constexpr std::size_t kChecksumSize = 4;
inline constexpr std::uint8_t kMaxWidth = 4;

inline constexpr unsigned kWidthClassShift = 14;
inline constexpr unsigned kChecksumFlagShift = 13;
inline constexpr unsigned kTagShift = 9;
inline constexpr std::uint16_t kWidthClassMask = 0x3;
inline constexpr std::uint16_t kTagMask = 0xF;
inline constexpr std::uint16_t kKeyLengthMask = 0x1FF;

inline constexpr std::uint64_t kMaxKeyLength = kKeyLengthMask;  // 511
// Largest length a 4 byte width field can carry. Values of exactly 4 GiB are
// rejected even though LMDB would store them.
inline constexpr std::uint64_t kMaxValueLength = 0xFFFFFFFFULL;
inline constexpr std::uint8_t kMaxTag = static_cast<std::uint8_t>(kTagMask);

// Width class stored in the header, indexed by width; width 4 is stored as 0
// because the field holds only two bits.
inline constexpr std::array<std::uint8_t, kMaxWidth + 1> kWidthToClass = {0xFF, 1, 2, 3, 0};
// Width indexed by stored class.
inline constexpr std::array<std::uint8_t, 4> kClassToWidth = {4, 1, 2, 3};

struct FrameHeader {
  std::uint8_t width = 1;
  bool checksummed = false;
  ExtensionTag tag = ExtensionTag::k0;
  std::uint16_t key_length = 0;
};

[[nodiscard]] std::uint8_t WidthOf(std::uint64_t length);
[[nodiscard]] std::uint8_t WidthClassOf(std::uint8_t width);
[[nodiscard]] std::uint8_t WidthOfClass(std::uint8_t width_class);

[[nodiscard]] std::uint16_t PackHeader(const FrameHeader& header);
[[nodiscard]] FrameHeader UnpackHeader(std::uint16_t word);

[[nodiscard]] std::array<std::byte, kHeaderSize> EncodeHeaderBytes(std::uint16_t word);
[[nodiscard]] std::uint16_t DecodeHeaderBytes(std::span<const std::byte> bytes);

// Returns the low `width` bytes of the big-endian 4 byte form of length. Only
// the first `width` entries of the result are meaningful.
[[nodiscard]] std::array<std::byte, kMaxWidth> EncodeValueLength(std::uint64_t length, std::uint8_t width);
// Interprets 1 to 4 bytes as a right-aligned big-endian length.
[[nodiscard]] std::uint32_t DecodeValueLength(std::span<const std::byte> bytes);

// Throws CodecError (phase kValidate) for input the frame cannot represent.
void ValidateRecordSize(std::uint64_t key_length, std::uint64_t value_length);
void ValidateTag(ExtensionTag tag);

}  // namespace kvframe::core::frame
