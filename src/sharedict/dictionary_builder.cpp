#include "sharedict/dictionary_builder.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <sstream>

namespace sharedict {

namespace {
const char *COMPONENT = "dictionary_builder";
}

DictionaryBuilder::DictionaryBuilder(ChunkStore &store, DictionaryStage &stage,
                                     double threshold)
    : store_(store), stage_(stage), threshold_(threshold) {}

size_t DictionaryBuilder::countUnique(std::vector<ChunkHash> combined) {
  if (combined.empty())
    return 0;
  std::sort(combined.begin(), combined.end());

  size_t uniq = 0;
  bool isDup = false;
  for (size_t i = 1; i < combined.size(); ++i) {
    if (combined[i] == combined[i - 1]) {
      isDup = true;
      continue;
    }
    // The run ending at i - 1 is complete.
    if (!isDup)
      ++uniq;
    isDup = false;
  }
  if (!isDup)
    ++uniq;
  return uniq;
}

ChangeDecision DictionaryBuilder::evaluate(
    const std::vector<ChunkHash> &active,
    const std::vector<ChunkHash> &candidate, double threshold) {
  ChangeDecision d;
  if (active.empty()) {
    d.bootstrap = true;
    return d;
  }
  std::vector<ChunkHash> combined;
  combined.reserve(active.size() + candidate.size());
  combined.insert(combined.end(), active.begin(), active.end());
  combined.insert(combined.end(), candidate.begin(), candidate.end());

  d.uniqueCount = countUnique(std::move(combined));
  d.ratio = static_cast<double>(d.uniqueCount) /
            static_cast<double>(active.size());
  d.rebuild = d.ratio > threshold;
  return d;
}

bool DictionaryBuilder::reevaluate() {
  std::vector<PopularChunk> candidates;
  try {
    candidates = store_.popularChunks();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                              std::string("Candidate query failed: ") +
                                  e.what());
    return false;
  }

  std::vector<ChunkHash> hashes;
  hashes.reserve(candidates.size());
  for (const auto &c : candidates)
    hashes.push_back(c.hash);

  const ChangeDecision d = evaluate(activeHashes(), hashes, threshold_);
  if (d.bootstrap) {
    if (!hashes.empty()) {
      Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                                "Bootstrapped active set with " +
                                    std::to_string(hashes.size()) +
                                    " candidate chunks");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = std::move(hashes);
    MetricsRegistry::instance().setGauge("sharedict_active_dictionary_chunks",
                                         static_cast<double>(active_.size()));
    return false;
  }

  if (!d.rebuild) {
    Logger::getInstance().log(LogLevel::TRACE, COMPONENT,
                              "Keeping dictionary, ratio " +
                                  std::to_string(d.ratio));
    return false;
  }

  std::vector<std::byte> content;
  for (const auto &c : candidates)
    content.insert(content.end(), c.content.begin(), c.content.end());
  const size_t bytes = content.size();

  std::ostringstream msg;
  msg << "Changing dict: " << d.uniqueCount << " unique hashes, ratio "
      << d.ratio << ", " << hashes.size() << " chunks, " << bytes << " bytes";
  Logger::getInstance().log(LogLevel::INFO, COMPONENT, msg.str());

  try {
    stage_.publish(std::move(content));
  } catch (const StageError &e) {
    Logger::getInstance().log(LogLevel::ERROR, COMPONENT, e.what());
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = std::move(hashes);
    MetricsRegistry::instance().setGauge("sharedict_active_dictionary_chunks",
                                         static_cast<double>(active_.size()));
  }
  MetricsRegistry::instance().setGauge("sharedict_dictionary_bytes",
                                       static_cast<double>(bytes));
  MetricsRegistry::instance().incrementCounter(
      "sharedict_dictionary_rebuilds_total");
  return true;
}

std::vector<ChunkHash> DictionaryBuilder::activeHashes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

} // namespace sharedict
