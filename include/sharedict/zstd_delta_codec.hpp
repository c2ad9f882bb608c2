#ifndef SHAREDICT_ZSTD_DELTA_CODEC_HPP
#define SHAREDICT_ZSTD_DELTA_CODEC_HPP

#include "sharedict/delta_codec.hpp"

namespace sharedict {

/**
 * @brief In-process codec: a zstd frame that uses the dictionary content as
 * a raw reference prefix.
 *
 * Frames carry their content size and a checksum. The window is sized to
 * reach from the end of the content back to the start of the dictionary.
 */
class ZstdDeltaCodec : public DeltaCodec {
public:
  static constexpr int DEFAULT_LEVEL = 3;

  /** @throw std::invalid_argument If @p level is outside zstd's range. */
  explicit ZstdDeltaCodec(int level = DEFAULT_LEVEL);

  std::vector<std::byte> encode(std::span<const std::byte> content,
                                const DictionaryRevision &dictionary) override;
  std::vector<std::byte> decode(std::span<const std::byte> diff,
                                const DictionaryRevision &dictionary) override;
  std::string name() const override { return "zstd"; }

  int level() const { return level_; }

  /** Window log needed to cover @p referenceBytes, clamped to [10, 30]. */
  static int windowLogFor(size_t referenceBytes);

private:
  int level_;
};

} // namespace sharedict

#endif // SHAREDICT_ZSTD_DELTA_CODEC_HPP
