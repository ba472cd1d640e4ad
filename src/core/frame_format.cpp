#include "frame_format.hpp"

#include "kvframe/errors.hpp"

#include <stdexcept>
#include <string>

namespace kvframe::core::frame {
namespace {

std::out_of_range FormatError(const std::string& message) {
  return std::out_of_range("frame format error: " + message);
}

CodecError ValidationError(ErrorKind kind, const std::string& message, std::uint64_t limit, std::uint64_t size) {
  return CodecError(kind, Phase::kValidate, "could not encode record: " + message, limit, size);
}

}  // namespace

std::uint8_t WidthOf(std::uint64_t length) {
  if (length < (1ULL << 8U)) {
    return 1;
  }
  if (length < (1ULL << 16U)) {
    return 2;
  }
  if (length < (1ULL << 24U)) {
    return 3;
  }
  if (length < (1ULL << 32U)) {
    return 4;
  }
  throw FormatError("value length " + std::to_string(length) + " exceeds the 4 byte length field");
}

std::uint8_t WidthClassOf(std::uint8_t width) {
  if (width == 0 || width > kMaxWidth) {
    throw FormatError("invalid value length width " + std::to_string(width));
  }
  return kWidthToClass[width];
}

std::uint8_t WidthOfClass(std::uint8_t width_class) {
  if (width_class >= kClassToWidth.size()) {
    throw FormatError("invalid width class " + std::to_string(width_class));
  }
  return kClassToWidth[width_class];
}

std::uint16_t PackHeader(const FrameHeader& header) {
  const auto tag = static_cast<std::uint8_t>(header.tag);
  if (tag > kMaxTag) {
    throw FormatError("extension tag " + std::to_string(tag) + " does not fit in 4 bits");
  }
  if (header.key_length > kMaxKeyLength) {
    throw FormatError("key length " + std::to_string(header.key_length) + " does not fit in 9 bits");
  }
  const auto width_class = static_cast<std::uint16_t>(WidthClassOf(header.width));
  const std::uint16_t flag = header.checksummed ? 1U : 0U;
  return static_cast<std::uint16_t>((width_class << kWidthClassShift) |
                                    (flag << kChecksumFlagShift) |
                                    (static_cast<std::uint16_t>(tag) << kTagShift) |
                                    header.key_length);
}

FrameHeader UnpackHeader(std::uint16_t word) {
  FrameHeader header{};
  header.width = WidthOfClass(static_cast<std::uint8_t>((word >> kWidthClassShift) & kWidthClassMask));
  header.checksummed = ((word >> kChecksumFlagShift) & 1U) == 1U;
  header.tag = static_cast<ExtensionTag>((word >> kTagShift) & kTagMask);
  header.key_length = static_cast<std::uint16_t>(word & kKeyLengthMask);
  return header;
}

std::array<std::byte, kHeaderSize> EncodeHeaderBytes(std::uint16_t word) {
  return {
      static_cast<std::byte>((word >> 8U) & 0xFFU),
      static_cast<std::byte>(word & 0xFFU),
  };
}

std::uint16_t DecodeHeaderBytes(std::span<const std::byte> bytes) {
  if (bytes.size() != kHeaderSize) {
    throw FormatError("header must be 2 bytes");
  }
  return static_cast<std::uint16_t>((std::to_integer<std::uint16_t>(bytes[0]) << 8U) |
                                    std::to_integer<std::uint16_t>(bytes[1]));
}

std::array<std::byte, kMaxWidth> EncodeValueLength(std::uint64_t length, std::uint8_t width) {
  if (width == 0 || width > kMaxWidth) {
    throw FormatError("invalid value length width " + std::to_string(width));
  }
  if (WidthOf(length) > width) {
    throw FormatError("value length " + std::to_string(length) + " does not fit in " +
                      std::to_string(width) + " bytes");
  }
  std::array<std::byte, kMaxWidth> out{};
  for (std::size_t i = 0; i < width; ++i) {
    const std::size_t shift = 8U * (width - 1U - i);
    out[i] = static_cast<std::byte>((length >> shift) & 0xFFU);
  }
  return out;
}

std::uint32_t DecodeValueLength(std::span<const std::byte> bytes) {
  if (bytes.empty() || bytes.size() > kMaxWidth) {
    throw FormatError("value length field must be 1 to 4 bytes");
  }
  std::uint32_t out = 0;
  for (const std::byte value : bytes) {
    out = (out << 8U) | std::to_integer<std::uint32_t>(value);
  }
  return out;
}

void ValidateRecordSize(std::uint64_t key_length, std::uint64_t value_length) {
  if (key_length > kMaxKeyLength) {
    throw ValidationError(ErrorKind::kKeyTooLong,
                          "maximum key length (511 B) exceeded: " + std::to_string(key_length),
                          kMaxKeyLength,
                          key_length);
  }
  if (value_length > kMaxValueLength) {
    throw ValidationError(ErrorKind::kValueTooLong,
                          "maximum value length (4 GiB - 1 B) exceeded: " + std::to_string(value_length),
                          kMaxValueLength,
                          value_length);
  }
}

void ValidateTag(ExtensionTag tag) {
  const auto value = static_cast<std::uint8_t>(tag);
  if (value > kMaxTag) {
    throw ValidationError(ErrorKind::kTagOutOfRange,
                          "extension tag out of range: " + std::to_string(value),
                          kMaxTag,
                          value);
  }
}

}  // namespace kvframe::core::frame
