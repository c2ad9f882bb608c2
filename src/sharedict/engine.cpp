#include "sharedict/engine.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace sharedict {

namespace {
const char *COMPONENT = "engine";
}

Engine::Engine(ChunkStore &store, DictionaryStage &stage, DeltaCodec &codec,
               EngineOptions options)
    : store_(store), stage_(stage), codec_(codec),
      chunker_(options.chunkBits),
      builder_(store, stage, options.rebuildThreshold),
      worker_(options.queueCapacity) {}

Engine::~Engine() { stop(); }

std::vector<std::byte> Engine::ingest(std::span<const std::byte> content) {
  auto &metrics = MetricsRegistry::instance();
  const auto revision = stage_.current();

  std::vector<std::byte> diff;
  try {
    diff = codec_.encode(content, *revision);
  } catch (const DeltaError &e) {
    ++stats_.encodeFailures;
    metrics.incrementCounter("sharedict_encode_failures_total");
    Logger::getInstance().log(LogLevel::WARN, COMPONENT,
                              codec_.name() + " encode failed: " + e.what());
    throw;
  } catch (const std::exception &e) {
    ++stats_.encodeFailures;
    metrics.incrementCounter("sharedict_encode_failures_total");
    throw DeltaError(codec_.name() + " encode failed: " + e.what());
  }

  if (!content.empty()) {
    metrics.observe("sharedict_diff_ratio", static_cast<double>(diff.size()) /
                                                static_cast<double>(content.size()));
  }

  auto copy = std::make_shared<const std::vector<std::byte>>(content.begin(),
                                                             content.end());
  if (!worker_.post([this, copy]() { learn(*copy); })) {
    ++stats_.droppedIngestions;
    metrics.incrementCounter("sharedict_dropped_ingestions_total");
    Logger::getInstance().log(LogLevel::WARN, COMPONENT,
                              "Ingestion queue full or stopped, dropping " +
                                  std::to_string(content.size()) + " bytes");
  }
  return diff;
}

void Engine::learn(const std::vector<std::byte> &content) {
  auto &metrics = MetricsRegistry::instance();
  const auto slices = chunker_.chunk(content);
  stats_.totalBytesIngested += content.size();
  metrics.incrementCounter("sharedict_bytes_ingested_total",
                           static_cast<double>(content.size()));

  std::vector<UpsertItem> batch;
  batch.reserve(slices.size());
  for (const auto &s : slices)
    batch.push_back(UpsertItem{s.hash, s.bytes});

  std::vector<uint64_t> counts;
  try {
    counts = store_.upsertBatch(batch);
  } catch (const StoreError &e) {
    Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                              std::string("Chunk batch rejected: ") +
                                  e.what());
    return;
  }

  uint64_t dupBytes = 0;
  for (size_t i = 0; i < slices.size() && i < counts.size(); ++i) {
    if (counts[i] > 1)
      dupBytes += slices[i].bytes.size();
  }
  stats_.totalBytesMatchedAsDuplicate += dupBytes;
  ++stats_.ingestions;
  metrics.incrementCounter("sharedict_duplicate_bytes_total",
                           static_cast<double>(dupBytes));
  metrics.incrementCounter("sharedict_ingestions_total");
  Logger::getInstance().log(LogLevel::DEBUG, COMPONENT,
                            "Ingested " + std::to_string(slices.size()) +
                                " chunks, " + statsLine());

  if (builder_.reevaluate())
    ++stats_.dictionaryRebuilds;
}

void Engine::drain() { worker_.drain(); }

void Engine::stop() { worker_.stop(); }

std::string Engine::statsLine() const {
  return "matched " + std::to_string(stats_.totalBytesMatchedAsDuplicate.load()) +
         " out of " + std::to_string(stats_.totalBytesIngested.load());
}

} // namespace sharedict
