#ifndef SHAREDICT_CHUNK_STORE_HPP
#define SHAREDICT_CHUNK_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "utilities/digest.hpp"

namespace sharedict {

/** Raised when the chunk table cannot be opened, read or written. */
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string &what) : std::runtime_error(what) {}
};

/** One chunk to count; @c content is only copied when the hash is new. */
struct UpsertItem {
  ChunkHash hash{};
  std::span<const std::byte> content;
};

struct PopularChunk {
  ChunkHash hash{};
  std::vector<std::byte> content;
  uint64_t count{0};
};

/**
 * @brief Content-addressed table of chunk -> occurrence count.
 *
 * Implementations must make each upsertBatch() call atomic: either every
 * item of the batch is counted or none is.
 */
class ChunkStore {
public:
  /// Chunks seen at least this often are dictionary candidates.
  static constexpr uint64_t POPULAR_MIN_COUNT = 2;

  virtual ~ChunkStore() = default;

  /**
   * @brief Insert @p hash with count 1, or increment its count.
   * @return The count after this call.
   */
  uint64_t upsert(const ChunkHash &hash, std::span<const std::byte> content);

  /**
   * @brief Upsert every item in order as one atomic batch.
   *
   * A hash repeated inside the batch is counted once per occurrence.
   * @return Count of each item right after it was applied.
   * @throw StoreError If the batch could not be made durable; the store is
   *        left exactly as it was before the call.
   */
  virtual std::vector<uint64_t>
  upsertBatch(const std::vector<UpsertItem> &batch) = 0;

  /**
   * @brief Chunks with count > 1, ordered by (count ascending, hash
   * descending).
   */
  virtual std::vector<PopularChunk> popularChunks() const = 0;

  /** Current count of @p hash, 0 if unknown. */
  virtual uint64_t occurrences(const ChunkHash &hash) const = 0;

  /** Number of distinct chunks. */
  virtual size_t size() const = 0;
};

/**
 * @brief Unsynchronised in-memory chunk table shared by the store
 * implementations. Callers provide locking.
 */
class ChunkIndex {
public:
  struct Entry {
    std::vector<std::byte> content;
    uint64_t count{0};
  };

  /** Add @p increment occurrences; @p content is used only for new hashes. */
  uint64_t add(const ChunkHash &hash, uint64_t increment,
               std::span<const std::byte> content);

  bool contains(const ChunkHash &hash) const {
    return entries_.count(hash) > 0;
  }
  uint64_t count(const ChunkHash &hash) const;
  size_t size() const { return entries_.size(); }
  void clear() { entries_.clear(); }

  std::vector<PopularChunk> popular(uint64_t minCount) const;

  const std::unordered_map<ChunkHash, Entry, ChunkHashHasher> &
  entries() const {
    return entries_;
  }

private:
  std::unordered_map<ChunkHash, Entry, ChunkHashHasher> entries_;
};

/**
 * @brief Process-local chunk store. Counts are lost on restart.
 */
class MemoryChunkStore : public ChunkStore {
public:
  std::vector<uint64_t>
  upsertBatch(const std::vector<UpsertItem> &batch) override;
  std::vector<PopularChunk> popularChunks() const override;
  uint64_t occurrences(const ChunkHash &hash) const override;
  size_t size() const override;

private:
  mutable std::mutex mutex_;
  ChunkIndex index_;
};

} // namespace sharedict

#endif // SHAREDICT_CHUNK_STORE_HPP
