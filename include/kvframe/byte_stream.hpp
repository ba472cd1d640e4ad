#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <span>
#include <utility>
#include <vector>

namespace kvframe {

class ByteSink {
 public:
  virtual ~ByteSink() = default;

  // Writes every byte or throws.
  virtual void Write(std::span<const std::byte> bytes) = 0;
};

class ByteSource {
 public:
  virtual ~ByteSource() = default;

  // Reads up to buffer.size() bytes. Returns 0 only when the source is
  // exhausted; throws on failure.
  virtual std::size_t Read(std::span<std::byte> buffer) = 0;
};

class OstreamSink final : public ByteSink {
 public:
  explicit OstreamSink(std::ostream& out) : out_(out) {}

  void Write(std::span<const std::byte> bytes) override;
  void Flush();

 private:
  std::ostream& out_;
};

class IstreamSource final : public ByteSource {
 public:
  explicit IstreamSource(std::istream& in) : in_(in) {}

  std::size_t Read(std::span<std::byte> buffer) override;

 private:
  std::istream& in_;
};

// In-memory FIFO: writes append, reads consume from the front.
class ByteBuffer final : public ByteSink, public ByteSource {
 public:
  ByteBuffer() = default;
  explicit ByteBuffer(std::vector<std::byte> initial) : bytes_(std::move(initial)) {}

  void Write(std::span<const std::byte> bytes) override;
  std::size_t Read(std::span<std::byte> buffer) override;

  [[nodiscard]] std::size_t size() const { return bytes_.size() - read_pos_; }
  [[nodiscard]] bool empty() const { return size() == 0; }
  [[nodiscard]] std::span<const std::byte> bytes() const;
  void Clear();

 private:
  void Compact();

  std::vector<std::byte> bytes_{};
  std::size_t read_pos_ = 0;
};

}  // namespace kvframe
