#include "sharedict/chunk_store.hpp"

#include <algorithm>

namespace sharedict {

uint64_t ChunkStore::upsert(const ChunkHash &hash,
                            std::span<const std::byte> content) {
  return upsertBatch({UpsertItem{hash, content}}).front();
}

uint64_t ChunkIndex::add(const ChunkHash &hash, uint64_t increment,
                         std::span<const std::byte> content) {
  auto it = entries_.find(hash);
  if (it == entries_.end()) {
    Entry e;
    e.content.assign(content.begin(), content.end());
    e.count = increment;
    entries_.emplace(hash, std::move(e));
    return increment;
  }
  it->second.count += increment;
  return it->second.count;
}

uint64_t ChunkIndex::count(const ChunkHash &hash) const {
  auto it = entries_.find(hash);
  return it == entries_.end() ? 0 : it->second.count;
}

std::vector<PopularChunk> ChunkIndex::popular(uint64_t minCount) const {
  std::vector<PopularChunk> out;
  for (const auto &kv : entries_) {
    if (kv.second.count < minCount)
      continue;
    out.push_back(PopularChunk{kv.first, kv.second.content, kv.second.count});
  }
  // Least popular first; ties broken by descending hash.
  std::sort(out.begin(), out.end(),
            [](const PopularChunk &a, const PopularChunk &b) {
              if (a.count != b.count)
                return a.count < b.count;
              return a.hash > b.hash;
            });
  return out;
}

std::vector<uint64_t>
MemoryChunkStore::upsertBatch(const std::vector<UpsertItem> &batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> counts;
  counts.reserve(batch.size());
  for (const auto &item : batch) {
    counts.push_back(index_.add(item.hash, 1, item.content));
  }
  return counts;
}

std::vector<PopularChunk> MemoryChunkStore::popularChunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.popular(POPULAR_MIN_COUNT);
}

uint64_t MemoryChunkStore::occurrences(const ChunkHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(hash);
}

size_t MemoryChunkStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.size();
}

} // namespace sharedict
