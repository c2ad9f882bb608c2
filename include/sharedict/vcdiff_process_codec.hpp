#ifndef SHAREDICT_VCDIFF_PROCESS_CODEC_HPP
#define SHAREDICT_VCDIFF_PROCESS_CODEC_HPP

#include <string>
#include <vector>

#include "sharedict/delta_codec.hpp"

namespace sharedict {

/**
 * @brief Codec backed by the open-vcdiff command line tool.
 *
 * The tool reads the dictionary from the staging file, so the revision
 * argument only has to be the one currently staged. Content goes to the
 * tool's stdin and the result is read from its stdout.
 */
class VcdiffProcessCodec : public DeltaCodec {
public:
  VcdiffProcessCodec(std::string binary, std::string dictionaryPath);

  std::vector<std::byte> encode(std::span<const std::byte> content,
                                const DictionaryRevision &dictionary) override;
  std::vector<std::byte> decode(std::span<const std::byte> diff,
                                const DictionaryRevision &dictionary) override;
  std::string name() const override { return "vcdiff"; }

  /** Command line used for encoding. */
  std::vector<std::string> encodeArgs() const;
  /** Command line used for decoding. */
  std::vector<std::string> decodeArgs() const;

private:
  std::vector<std::byte> run(const std::vector<std::string> &argv,
                             std::span<const std::byte> input) const;

  std::string binary_;
  std::string dictionaryPath_;
};

} // namespace sharedict

#endif // SHAREDICT_VCDIFF_PROCESS_CODEC_HPP
