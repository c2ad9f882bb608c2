#ifndef SHAREDICT_JOURNAL_CHUNK_STORE_HPP
#define SHAREDICT_JOURNAL_CHUNK_STORE_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "sharedict/chunk_store.hpp"

namespace sharedict {

struct JournalOptions {
  bool syncWrites = true;               ///< fdatasync after every batch
  uint64_t compactAfterBytes = 64ull << 20; ///< 0 disables compaction
};

/**
 * @brief Durable chunk store: an in-memory ChunkIndex rebuilt at startup
 * from an append-only journal of batch records.
 *
 * Journal layout (little endian):
 * @code
 *   "SDJ1"
 *   repeat {
 *     u32 'BTCH' | u32 entryCount | u64 payloadLen | payload | sha256(payload)
 *   }
 *   entry: hash[32] | u64 increment | u8 flags | u32 contentLen | content
 * @endcode
 * Content is written only the first time a hash is seen (flags bit 0 set);
 * entries without it increment an existing chunk. A record is applied to
 * the index only after it is fully on disk, and replay stops at the first
 * torn or corrupt record, which is truncated away. Each batch is therefore
 * all-or-nothing across crashes.
 */
class JournalChunkStore : public ChunkStore {
public:
  struct RecoveryInfo {
    size_t batchesReplayed{0};
    uint64_t bytesDiscarded{0};
  };

  /**
   * @brief Open (or create) the journal at @p path and replay it.
   * @throw StoreError If the file cannot be created, read or is not a
   *        journal.
   */
  explicit JournalChunkStore(const std::string &path,
                             JournalOptions options = {});
  ~JournalChunkStore() override;

  JournalChunkStore(const JournalChunkStore &) = delete;
  JournalChunkStore &operator=(const JournalChunkStore &) = delete;

  std::vector<uint64_t>
  upsertBatch(const std::vector<UpsertItem> &batch) override;
  std::vector<PopularChunk> popularChunks() const override;
  uint64_t occurrences(const ChunkHash &hash) const override;
  size_t size() const override;

  /**
   * @brief Rewrite the journal as one record per chunk.
   *
   * The new journal is written next to the old one and renamed over it, so a
   * crash leaves either file intact.
   * @throw StoreError On I/O failure; the current journal stays in use.
   */
  void compact();

  const std::string &path() const { return path_; }
  uint64_t journalBytes() const;
  RecoveryInfo recovery() const { return recovery_; }

private:
  void openAndReplay();
  void replay(const std::vector<std::byte> &data);
  void appendOrRollback(const std::vector<std::byte> &record);
  void compactLocked();

  std::string path_;
  JournalOptions options_;
  int fd_ = -1;
  uint64_t journalSize_ = 0;
  uint64_t compactedSize_ = 0;
  RecoveryInfo recovery_;

  mutable std::mutex mutex_;
  ChunkIndex index_;
};

} // namespace sharedict

#endif // SHAREDICT_JOURNAL_CHUNK_STORE_HPP
