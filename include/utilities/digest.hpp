#ifndef SHAREDICT_DIGEST_HPP
#define SHAREDICT_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include <sodium.h>

namespace sharedict {

/// Digest size for chunk hashes (SHA-256, 32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

/**
 * @brief Content digest of a chunk.
 *
 * Ordering is unsigned byte-wise lexicographic, which is the order
 * std::array already provides for uint8_t elements.
 */
using ChunkHash = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Incremental SHA-256 hasher backed by libsodium.
 *
 * Feed any number of byte ranges, then call finalize() exactly once.
 */
class Digest {
public:
  Digest();

  void ingest(const std::byte *data, size_t size);
  void ingest(std::span<const std::byte> data) {
    ingest(data.data(), data.size());
  }

  /**
   * @brief Finish hashing.
   * @throw std::logic_error If called more than once.
   */
  ChunkHash finalize();

  /** One-shot convenience wrapper. */
  static ChunkHash of(std::span<const std::byte> data);

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

/// Lowercase hex representation of a hash.
std::string toHex(const ChunkHash &hash);

/**
 * @brief Parse a 64 character hex string.
 * @throw std::invalid_argument On bad length or characters.
 */
ChunkHash fromHex(const std::string &hex);

/// Hasher for unordered containers keyed by ChunkHash.
struct ChunkHashHasher {
  size_t operator()(const ChunkHash &h) const noexcept {
    // SHA-256 output is uniformly distributed; the first word is enough.
    size_t v = 0;
    for (size_t i = 0; i < sizeof(size_t); ++i)
      v = (v << 8) | h[i];
    return v;
  }
};

/// View a string's characters as bytes.
inline std::span<const std::byte> asBytes(const std::string &s) {
  return {reinterpret_cast<const std::byte *>(s.data()), s.size()};
}

/// Copy a byte range into a std::string.
inline std::string toString(std::span<const std::byte> bytes) {
  return std::string(reinterpret_cast<const char *>(bytes.data()),
                     bytes.size());
}

} // namespace sharedict

#endif // SHAREDICT_DIGEST_HPP
