#ifndef SHAREDICT_ENGINE_HPP
#define SHAREDICT_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "sharedict/chunk_store.hpp"
#include "sharedict/chunker.hpp"
#include "sharedict/delta_codec.hpp"
#include "sharedict/dictionary_builder.hpp"
#include "sharedict/dictionary_stage.hpp"
#include "sharedict/ingestion_worker.hpp"

namespace sharedict {

struct EngineOptions {
  unsigned chunkBits = Chunker::DEFAULT_BITS;
  double rebuildThreshold = DictionaryBuilder::DEFAULT_THRESHOLD;
  size_t queueCapacity = IngestionWorker::DEFAULT_CAPACITY;
};

/** Process-wide counters; only ever increase. */
struct EngineStats {
  std::atomic<uint64_t> totalBytesIngested{0};
  std::atomic<uint64_t> totalBytesMatchedAsDuplicate{0};
  std::atomic<uint64_t> ingestions{0};
  std::atomic<uint64_t> encodeFailures{0};
  std::atomic<uint64_t> droppedIngestions{0};
  std::atomic<uint64_t> dictionaryRebuilds{0};
};

/**
 * @brief Entry point for response bodies: encode now, learn later.
 *
 * ingest() encodes synchronously against the published revision and hands
 * a copy of the content to the ingestion worker, which chunks it, counts the
 * chunks and lets the builder decide on a new dictionary. The store, stage
 * and codec must outlive the engine.
 */
class Engine {
public:
  Engine(ChunkStore &store, DictionaryStage &stage, DeltaCodec &codec,
         EngineOptions options = {});
  ~Engine();

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  /**
   * @brief Encode @p content and schedule its ingestion.
   * @throw DeltaError If the codec fails; nothing is scheduled then.
   */
  std::vector<std::byte> ingest(std::span<const std::byte> content);

  /** Wait for every scheduled ingestion to finish. */
  void drain();
  /** Drain and stop the worker; later ingest() calls are not learned. */
  void stop();

  const EngineStats &stats() const { return stats_; }
  /** "matched <duplicate bytes> out of <ingested bytes>" */
  std::string statsLine() const;

  const DictionaryBuilder &builder() const { return builder_; }
  const Chunker &chunker() const { return chunker_; }

private:
  void learn(const std::vector<std::byte> &content);

  ChunkStore &store_;
  DictionaryStage &stage_;
  DeltaCodec &codec_;
  Chunker chunker_;
  DictionaryBuilder builder_;
  EngineStats stats_;
  IngestionWorker worker_;
};

} // namespace sharedict

#endif // SHAREDICT_ENGINE_HPP
