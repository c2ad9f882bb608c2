#include "sharedict/zstd_delta_codec.hpp"

#include <memory>
#include <zstd.h>

namespace sharedict {

namespace {

constexpr int MIN_WINDOW_LOG = 10;
constexpr int MAX_WINDOW_LOG = 30;

struct CCtxDeleter {
  void operator()(ZSTD_CCtx *c) const { ZSTD_freeCCtx(c); }
};
struct DCtxDeleter {
  void operator()(ZSTD_DCtx *d) const { ZSTD_freeDCtx(d); }
};

void check(size_t rc, const char *what) {
  if (ZSTD_isError(rc))
    throw DeltaError(std::string(what) + ": " + ZSTD_getErrorName(rc));
}

} // namespace

ZstdDeltaCodec::ZstdDeltaCodec(int level) : level_(level) {
  if (level < ZSTD_minCLevel() || level > ZSTD_maxCLevel())
    throw std::invalid_argument("zstd level " + std::to_string(level) +
                                " out of range");
}

int ZstdDeltaCodec::windowLogFor(size_t referenceBytes) {
  int log = MIN_WINDOW_LOG;
  while (log < MAX_WINDOW_LOG && (size_t{1} << log) < referenceBytes)
    ++log;
  return log;
}

std::vector<std::byte>
ZstdDeltaCodec::encode(std::span<const std::byte> content,
                       const DictionaryRevision &dictionary) {
  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
  if (!cctx)
    throw DeltaError("ZSTD_createCCtx failed");

  const int windowLog =
      windowLogFor(dictionary.content.size() + content.size());
  check(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level_),
        "set compression level");
  check(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 1),
        "set checksum flag");
  check(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_windowLog, windowLog),
        "set window log");
  if (!dictionary.empty()) {
    check(ZSTD_CCtx_refPrefix(cctx.get(), dictionary.content.data(),
                              dictionary.content.size()),
          "reference dictionary");
  }

  std::vector<std::byte> out(ZSTD_compressBound(content.size()));
  const size_t n = ZSTD_compress2(cctx.get(), out.data(), out.size(),
                                  content.data(), content.size());
  check(n, "ZSTD_compress2 failed");
  out.resize(n);
  return out;
}

std::vector<std::byte>
ZstdDeltaCodec::decode(std::span<const std::byte> diff,
                       const DictionaryRevision &dictionary) {
  const unsigned long long size =
      ZSTD_getFrameContentSize(diff.data(), diff.size());
  if (size == ZSTD_CONTENTSIZE_ERROR)
    throw DeltaError("Not a zstd frame");
  if (size == ZSTD_CONTENTSIZE_UNKNOWN)
    throw DeltaError("zstd frame does not record its content size");

  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
  if (!dctx)
    throw DeltaError("ZSTD_createDCtx failed");
  check(ZSTD_DCtx_setParameter(dctx.get(), ZSTD_d_windowLogMax,
                               MAX_WINDOW_LOG),
        "set window log max");
  if (!dictionary.empty()) {
    check(ZSTD_DCtx_refPrefix(dctx.get(), dictionary.content.data(),
                              dictionary.content.size()),
          "reference dictionary");
  }

  std::vector<std::byte> out(static_cast<size_t>(size));
  const size_t n = ZSTD_decompressDCtx(dctx.get(), out.data(), out.size(),
                                       diff.data(), diff.size());
  check(n, "ZSTD_decompressDCtx failed");
  if (n != out.size())
    throw DeltaError("zstd frame decoded to " + std::to_string(n) +
                     " bytes, expected " + std::to_string(out.size()));
  return out;
}

} // namespace sharedict
