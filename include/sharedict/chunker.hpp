#ifndef SHAREDICT_CHUNKER_HPP
#define SHAREDICT_CHUNKER_HPP

#include <cstddef>
#include <span>
#include <vector>

#include "utilities/digest.hpp"

namespace sharedict {

/** One content-defined chunk; @c bytes views the caller's buffer. */
struct ChunkSlice {
  size_t offset{0};
  std::span<const std::byte> bytes;
  ChunkHash hash{};
};

/**
 * @brief Content-defined chunker.
 *
 * A RollingChecksum runs over the whole input without being reset between
 * chunks. After each byte is rolled in, a chunk is closed (inclusive) when
 * the low @c bits of the checksum are zero, giving an average chunk size of
 * 2^bits. Whatever follows the last boundary forms a final partial chunk.
 * Chunk sizes are not bounded in either direction.
 */
class Chunker {
public:
  static constexpr unsigned DEFAULT_BITS = 5;

  /** @throw std::invalid_argument If @p bits is not in [1, 24]. */
  explicit Chunker(unsigned bits = DEFAULT_BITS);

  unsigned bits() const { return bits_; }

  /**
   * @brief Split @p content into chunks and hash each one.
   *
   * The returned slices reference @p content, which must outlive them.
   * Empty input yields no chunks.
   */
  std::vector<ChunkSlice> chunk(std::span<const std::byte> content) const;

  /** Boundary positions only (end offsets, exclusive); no hashing. */
  std::vector<size_t> boundaries(std::span<const std::byte> content) const;

private:
  unsigned bits_;
};

} // namespace sharedict

#endif // SHAREDICT_CHUNKER_HPP
