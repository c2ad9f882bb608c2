#ifndef SHAREDICT_DICTIONARY_STAGE_HPP
#define SHAREDICT_DICTIONARY_STAGE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sharedict {

/** Raised when a dictionary revision cannot be loaded or published. */
class StageError : public std::runtime_error {
public:
  explicit StageError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Immutable materialized dictionary.
 *
 * Serial 0 with no content stands for "no dictionary yet".
 */
struct DictionaryRevision {
  uint64_t serial{0};
  std::vector<std::byte> content;
  std::string userAgentId; ///< base64url of SHA-256(resource)[0..6)
  std::string serverId;    ///< base64url of SHA-256(resource)[6..12)

  bool empty() const { return content.empty(); }
  /** Resource name the dictionary is served under. */
  const std::string &name() const { return userAgentId; }
};

struct StageOptions {
  std::string stagingPath;
  std::string archiveDir;
  bool archiveRevisions{false};
  std::string domain{"localhost"};
  std::string path{"/"};
  bool syncWrites{true};
};

/**
 * @brief Owns the published DictionaryRevision and its staging file.
 *
 * publish() writes the new bytes to a temporary file, renames it over the
 * staging file and only then swaps the in-memory pointer, so both file
 * readers (an external delta tool) and in-process readers observe either the
 * complete old revision or the complete new one.
 */
class DictionaryStage {
public:
  static constexpr const char *CONTENT_TYPE = "application/x-sdch-dictionary";

  /**
   * @brief Load the staging file left by a previous run, or create an empty
   * one so external tools always find a dictionary file.
   * @throw StageError If the staging file cannot be read or created.
   */
  explicit DictionaryStage(StageOptions options);

  /** Snapshot of the revision in force; never null. */
  std::shared_ptr<const DictionaryRevision> current() const;

  /**
   * @brief Publish @p content as the next revision.
   * @throw StageError If the staging file could not be replaced; the
   *        current revision stays in force.
   */
  std::shared_ptr<const DictionaryRevision>
  publish(std::vector<std::byte> content);

  /** SDCH dictionary header: "Domain: <d>\nPath: <p>\n\n". */
  std::string header() const;

  /** Bytes served for the current revision: header followed by content. */
  std::vector<std::byte> resource() const;

  const std::string &stagingPath() const { return options_.stagingPath; }

  /**
   * @brief Derive the SDCH user agent and server identifiers for a
   * dictionary resource (header plus content).
   */
  static void computeIds(const std::string &header,
                         const std::vector<std::byte> &content,
                         std::string &userAgentId, std::string &serverId);

private:
  std::shared_ptr<const DictionaryRevision>
  makeRevision(uint64_t serial, std::vector<std::byte> content) const;
  void archive(const DictionaryRevision &rev) const;

  StageOptions options_;
  mutable std::mutex mutex_;
  std::mutex publishMutex_;
  std::shared_ptr<const DictionaryRevision> current_;
};

} // namespace sharedict

#endif // SHAREDICT_DICTIONARY_STAGE_HPP
