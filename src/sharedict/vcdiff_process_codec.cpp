#include "sharedict/vcdiff_process_codec.hpp"
#include "utilities/logger.h"
#include "utilities/subprocess.hpp"

namespace sharedict {

VcdiffProcessCodec::VcdiffProcessCodec(std::string binary,
                                       std::string dictionaryPath)
    : binary_(std::move(binary)), dictionaryPath_(std::move(dictionaryPath)) {
  if (binary_.empty())
    throw std::invalid_argument("vcdiff binary is empty");
}

std::vector<std::string> VcdiffProcessCodec::encodeArgs() const {
  return {binary_,         "delta",        "-dictionary",
          dictionaryPath_, "-interleaved", "-checksum"};
}

std::vector<std::string> VcdiffProcessCodec::decodeArgs() const {
  return {binary_, "patch", "-dictionary", dictionaryPath_};
}

std::vector<std::byte>
VcdiffProcessCodec::encode(std::span<const std::byte> content,
                           const DictionaryRevision &) {
  return run(encodeArgs(), content);
}

std::vector<std::byte>
VcdiffProcessCodec::decode(std::span<const std::byte> diff,
                           const DictionaryRevision &) {
  return run(decodeArgs(), diff);
}

std::vector<std::byte>
VcdiffProcessCodec::run(const std::vector<std::string> &argv,
                        std::span<const std::byte> input) const {
  SubprocessResult res;
  try {
    res = runSubprocess(argv, input);
  } catch (const SubprocessError &e) {
    throw DeltaError(std::string("Cannot run ") + binary_ + ": " + e.what());
  }
  if (res.exitStatus != 0) {
    Logger::getInstance().log(LogLevel::DEBUG, "vcdiff",
                              "vcdiff " + argv[1] + " exited with " +
                                  std::to_string(res.exitStatus));
    throw DeltaError(binary_ + " " + argv[1] + " failed (status " +
                     std::to_string(res.exitStatus) + "): " + res.err);
  }
  return std::move(res.out);
}

} // namespace sharedict
