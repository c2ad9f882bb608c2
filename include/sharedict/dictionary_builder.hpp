#ifndef SHAREDICT_DICTIONARY_BUILDER_HPP
#define SHAREDICT_DICTIONARY_BUILDER_HPP

#include <cstddef>
#include <mutex>
#include <vector>

#include "sharedict/chunk_store.hpp"
#include "sharedict/dictionary_stage.hpp"

namespace sharedict {

/** Outcome of comparing the active dictionary with the candidate set. */
struct ChangeDecision {
  bool bootstrap{false}; ///< active set was empty; candidates adopted as is
  bool rebuild{false};   ///< ratio exceeded the threshold
  size_t uniqueCount{0};
  double ratio{0.0};
};

/**
 * @brief Decides when the active dictionary must be replaced and
 * materializes the replacement.
 *
 * Only the ingestion worker calls reevaluate(); activeHashes() may be called
 * from anywhere.
 */
class DictionaryBuilder {
public:
  static constexpr double DEFAULT_THRESHOLD = 0.10;

  DictionaryBuilder(ChunkStore &store, DictionaryStage &stage,
                    double threshold = DEFAULT_THRESHOLD);

  /**
   * @brief Count hashes of the merged sequence that have no equal neighbour.
   *
   * @p combined is sorted ascending and scanned once. A run of equal hashes
   * is marked duplicate at its first matching pair and nothing in it is
   * counted; every run that never matched counts once. A run of three or
   * more identical hashes is therefore one duplicate, the same as a pair.
   */
  static size_t countUnique(std::vector<ChunkHash> combined);

  /**
   * @brief Pure change-detection step.
   *
   * Empty @p active means bootstrap. Otherwise rebuild iff
   * countUnique(active ++ candidate) / |active| > @p threshold (strictly).
   */
  static ChangeDecision evaluate(const std::vector<ChunkHash> &active,
                                 const std::vector<ChunkHash> &candidate,
                                 double threshold);

  /**
   * @brief Query the store and rebuild the dictionary when needed.
   *
   * Store and publish failures are logged and treated as "no rebuild"; the
   * active set is only replaced after a successful publish.
   * @return true when a new revision was published.
   */
  bool reevaluate();

  /** Copy of the hashes of the dictionary in force. */
  std::vector<ChunkHash> activeHashes() const;

  double threshold() const { return threshold_; }

private:
  ChunkStore &store_;
  DictionaryStage &stage_;
  double threshold_;

  mutable std::mutex mutex_;
  std::vector<ChunkHash> active_;
};

} // namespace sharedict

#endif // SHAREDICT_DICTIONARY_BUILDER_HPP
