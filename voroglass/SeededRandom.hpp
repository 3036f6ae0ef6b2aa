#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace voroglass
{
/**
 * @class SeededRandom
 * @brief Deterministic pseudo-random stream of doubles in [0, 1).
 *
 * The state is a single 32-bit word advanced by a fixed odd constant. Every output is derived from the state by two
 * xor-shift/multiply rounds, so the sequence is bit-reproducible across platforms. An instance is a plain value and
 * must not be shared between threads.
 */
class SeededRandom
{
 private:
  uint32_t state;

 public:
  /**
   * @brief Creates a stream from an explicit 32-bit state.
   * @param seed Initial state.
   */
  explicit SeededRandom(uint32_t seed);

  /**
   * @brief Creates a stream from an optional string seed.
   *
   * With a seed the state is `hashString(*seed)`, without one it is drawn from `std::random_device`.
   */
  explicit SeededRandom(const std::optional<std::string>& seed);

  /**
   * @brief Advances the stream and returns the next value.
   * @return A value in [0, 1).
   */
  double next();

  double operator()() { return next(); }

  uint32_t getState() const { return state; }

  /**
   * @brief Folds a string into 32 bits with `h = 31 * h + unit`, wrapping on overflow.
   *
   * The input is decoded as UTF-8 and folded over its UTF-16 code units, so characters outside the BMP contribute a
   * surrogate pair. Malformed bytes count as U+FFFD.
   */
  static uint32_t hashString(const std::string& str);
};
}
