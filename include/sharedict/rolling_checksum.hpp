#ifndef SHAREDICT_ROLLING_CHECKSUM_HPP
#define SHAREDICT_ROLLING_CHECKSUM_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace sharedict {

/**
 * @brief bup-style rolling checksum over a fixed 64 byte window.
 *
 * Two running sums are kept: @c s1 is the sum of the window bytes (each
 * offset by a constant) and @c s2 the sum of the successive @c s1 values.
 * Rolling a byte in also rolls the oldest byte out, so every update is O(1)
 * and the state depends only on the last WINDOW_SIZE bytes seen.
 */
class RollingChecksum {
public:
  static constexpr size_t WINDOW_SIZE = 64;
  static constexpr uint32_t CHAR_OFFSET = 31;

  RollingChecksum() { reset(); }

  /** Return to the freshly constructed state (zero-filled window). */
  void reset();

  /** Fold @p byte into the window, dropping the oldest byte. */
  void roll(uint8_t byte) {
    uint8_t &slot = window_[offset_];
    add(slot, byte);
    slot = byte;
    offset_ = (offset_ + 1) & (WINDOW_SIZE - 1);
  }

  /** True when the low @p bits of the checksum are all zero. */
  bool onBoundary(unsigned bits) const {
    const uint32_t mask = (uint32_t{1} << bits) - 1;
    return (s2_ & mask) == 0;
  }

  /** 32 bit digest of the current window. */
  uint32_t digest() const { return (s1_ << 16) | (s2_ & 0xffff); }

  uint32_t s1() const { return s1_; }
  uint32_t s2() const { return s2_; }

private:
  void add(uint32_t drop, uint32_t in) {
    s1_ += in - drop;
    s2_ += s1_ - static_cast<uint32_t>(WINDOW_SIZE) * (drop + CHAR_OFFSET);
  }

  uint32_t s1_ = 0;
  uint32_t s2_ = 0;
  std::array<uint8_t, WINDOW_SIZE> window_{};
  size_t offset_ = 0;
};

static_assert((RollingChecksum::WINDOW_SIZE &
               (RollingChecksum::WINDOW_SIZE - 1)) == 0,
              "window size must be a power of two");

} // namespace sharedict

#endif // SHAREDICT_ROLLING_CHECKSUM_HPP
