#include "sharedict/rolling_checksum.hpp"

namespace sharedict {

void RollingChecksum::reset() {
  // Start as if the window had been filled with zero bytes
  s1_ = static_cast<uint32_t>(WINDOW_SIZE) * CHAR_OFFSET;
  s2_ = static_cast<uint32_t>(WINDOW_SIZE) *
        static_cast<uint32_t>(WINDOW_SIZE - 1) * CHAR_OFFSET;
  window_.fill(0);
  offset_ = 0;
}

} // namespace sharedict
