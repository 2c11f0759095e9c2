#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace starlane {

// -----------------------------------------------------------------------------
// SeededRandom
// -----------------------------------------------------------------------------
// 32-bit xorshift generator. The same seed always yields the same sequence,
// so an AI player makes the same choices when a game is replayed.
// -----------------------------------------------------------------------------
class SeededRandom {
 public:
  explicit SeededRandom(std::uint32_t seed = 1) : state_(seed) {}

  // Uniform in [0, 1].
  double next() {
    state_ ^= state_ << 13;
    state_ ^= state_ >> 17;
    state_ ^= state_ << 5;
    return static_cast<double>(state_) / 4294967295.0;
  }

  // Uniform in [min, max]; the bounds may be given in either order.
  double nextFloat(double min, double max) {
    if (min > max) {
      std::swap(min, max);
    }
    return min + next() * (max - min);
  }

  // 31-bit string hash (h * 31 + c over the bytes, sign dropped).
  static std::uint32_t hashSeed(const std::string& text) {
    std::int32_t hash = 0;
    for (unsigned char c : text) {
      hash = static_cast<std::int32_t>(
          static_cast<std::uint32_t>(hash) * 31u + c);
    }
    const std::int64_t wide = hash;
    return static_cast<std::uint32_t>(wide < 0 ? -wide : wide);
  }

 private:
  std::uint32_t state_;
};

}  // namespace starlane
