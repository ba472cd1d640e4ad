#pragma once

#include "kvframe/hash32.hpp"

namespace kvframe::core {

// Resets a hasher when leaving scope, including on exceptions.
class ScopedHashReset {
 public:
  explicit ScopedHashReset(Hash32& hasher) : hasher_(hasher) {}
  ScopedHashReset(const ScopedHashReset&) = delete;
  ScopedHashReset& operator=(const ScopedHashReset&) = delete;
  ~ScopedHashReset() noexcept { hasher_.Reset(); }

 private:
  Hash32& hasher_;
};

}  // namespace kvframe::core
