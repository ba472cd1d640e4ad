#include "kvframe/byte_stream.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace kvframe {
namespace {

std::runtime_error StreamError(const std::string& message) {
  return std::runtime_error("byte stream: " + message);
}

// Unread prefix is dropped once it dominates the buffer.
constexpr std::size_t kCompactThreshold = 64U * 1024U;

}  // namespace

void OstreamSink::Write(std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return;
  }
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_) {
    throw StreamError("failed to write " + std::to_string(bytes.size()) + " bytes");
  }
}

void OstreamSink::Flush() {
  out_.flush();
  if (!out_) {
    throw StreamError("failed to flush output");
  }
}

std::size_t IstreamSource::Read(std::span<std::byte> buffer) {
  if (buffer.empty()) {
    return 0;
  }
  in_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
  const std::streamsize got = in_.gcount();
  if (in_.bad()) {
    throw StreamError("failed to read input");
  }
  return static_cast<std::size_t>(got);
}

void ByteBuffer::Write(std::span<const std::byte> bytes) {
  bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
}

std::size_t ByteBuffer::Read(std::span<std::byte> buffer) {
  const std::size_t count = std::min(buffer.size(), size());
  std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(read_pos_), count, buffer.begin());
  read_pos_ += count;
  Compact();
  return count;
}

std::span<const std::byte> ByteBuffer::bytes() const {
  return std::span<const std::byte>(bytes_).subspan(read_pos_);
}

void ByteBuffer::Clear() {
  bytes_.clear();
  read_pos_ = 0;
}

void ByteBuffer::Compact() {
  if (read_pos_ == bytes_.size()) {
    Clear();
    return;
  }
  if (read_pos_ >= kCompactThreshold && read_pos_ * 2 >= bytes_.size()) {
    bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
  }
}

}  // namespace kvframe
