#ifndef SHAREDICT_DELTA_CODEC_HPP
#define SHAREDICT_DELTA_CODEC_HPP

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "sharedict/dictionary_stage.hpp"

namespace sharedict {

/** Raised when content cannot be encoded against, or decoded from, a
 * dictionary. */
class DeltaError : public std::runtime_error {
public:
  explicit DeltaError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Delta encoder with a shared dictionary as reference.
 *
 * The revision may be empty (bootstrap); codecs must still produce a valid
 * diff in that case. Implementations are called concurrently from request
 * threads and must not keep per-call state in members.
 */
class DeltaCodec {
public:
  virtual ~DeltaCodec() = default;

  /** @throw DeltaError On failure. */
  virtual std::vector<std::byte>
  encode(std::span<const std::byte> content,
         const DictionaryRevision &dictionary) = 0;

  /** Reverse of encode() against the same revision. @throw DeltaError */
  virtual std::vector<std::byte>
  decode(std::span<const std::byte> diff,
         const DictionaryRevision &dictionary) = 0;

  virtual std::string name() const = 0;
};

} // namespace sharedict

#endif // SHAREDICT_DELTA_CODEC_HPP
