#include "sharedict/chunker.hpp"
#include "sharedict/rolling_checksum.hpp"

#include <stdexcept>
#include <string>

namespace sharedict {

Chunker::Chunker(unsigned bits) : bits_(bits) {
  if (bits < 1 || bits > 24) {
    throw std::invalid_argument("Chunker: boundary bits must be in [1, 24], "
                                "got " +
                                std::to_string(bits));
  }
}

std::vector<size_t>
Chunker::boundaries(std::span<const std::byte> content) const {
  std::vector<size_t> ends;
  RollingChecksum rs;
  for (size_t i = 0; i < content.size(); ++i) {
    rs.roll(static_cast<uint8_t>(content[i]));
    if (rs.onBoundary(bits_))
      ends.push_back(i + 1);
  }
  if (!content.empty() && (ends.empty() || ends.back() != content.size()))
    ends.push_back(content.size());
  return ends;
}

std::vector<ChunkSlice>
Chunker::chunk(std::span<const std::byte> content) const {
  std::vector<ChunkSlice> chunks;
  size_t start = 0;
  for (size_t end : boundaries(content)) {
    ChunkSlice c;
    c.offset = start;
    c.bytes = content.subspan(start, end - start);
    c.hash = Digest::of(c.bytes);
    chunks.push_back(c);
    start = end;
  }
  return chunks;
}

} // namespace sharedict
