#include "sharedict/journal_chunk_store.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <limits>
#include <sys/stat.h>
#include <unistd.h>
#include <unordered_set>

namespace sharedict {

namespace {

constexpr char FILE_MAGIC[4] = {'S', 'D', 'J', '1'};
constexpr uint32_t BATCH_MAGIC = 0x48435442; // "BTCH" little endian
constexpr size_t RECORD_HEADER = 4 + 4 + 8;
constexpr size_t ENTRY_HEADER = DIGEST_SIZE + 8 + 1 + 4;
constexpr uint8_t FLAG_HAS_CONTENT = 0x01;

const char *COMPONENT = "chunk_store";

struct JournalEntry {
  ChunkHash hash{};
  uint64_t increment{0};
  bool hasContent{false};
  std::span<const std::byte> content;
};

void putU32(std::vector<std::byte> &out, uint32_t v) {
  for (int i = 0; i < 4; ++i)
    out.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xff));
}

void putU64(std::vector<std::byte> &out, uint64_t v) {
  for (int i = 0; i < 8; ++i)
    out.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xff));
}

uint32_t getU32(const std::byte *p) {
  uint32_t v = 0;
  for (int i = 3; i >= 0; --i)
    v = (v << 8) | std::to_integer<uint32_t>(p[i]);
  return v;
}

uint64_t getU64(const std::byte *p) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i)
    v = (v << 8) | std::to_integer<uint64_t>(p[i]);
  return v;
}

std::vector<std::byte> encodeRecord(const std::vector<JournalEntry> &entries) {
  std::vector<std::byte> payload;
  for (const auto &e : entries) {
    auto *h = reinterpret_cast<const std::byte *>(e.hash.data());
    payload.insert(payload.end(), h, h + e.hash.size());
    putU64(payload, e.increment);
    payload.push_back(static_cast<std::byte>(e.hasContent ? FLAG_HAS_CONTENT
                                                          : 0));
    putU32(payload, static_cast<uint32_t>(e.content.size()));
    payload.insert(payload.end(), e.content.begin(), e.content.end());
  }

  std::vector<std::byte> record;
  record.reserve(RECORD_HEADER + payload.size() + DIGEST_SIZE);
  putU32(record, BATCH_MAGIC);
  putU32(record, static_cast<uint32_t>(entries.size()));
  putU64(record, payload.size());
  record.insert(record.end(), payload.begin(), payload.end());
  ChunkHash sum = Digest::of(payload);
  auto *s = reinterpret_cast<const std::byte *>(sum.data());
  record.insert(record.end(), s, s + sum.size());
  return record;
}

// Parses @p payload into entries that view it. Returns false on malformed
// input with @p problem describing why.
bool decodeEntries(std::span<const std::byte> payload, uint32_t entryCount,
                   std::vector<JournalEntry> &out, std::string &problem) {
  size_t pos = 0;
  for (uint32_t i = 0; i < entryCount; ++i) {
    if (payload.size() - pos < ENTRY_HEADER) {
      problem = "entry header past end of payload";
      return false;
    }
    JournalEntry e;
    std::memcpy(e.hash.data(), payload.data() + pos, DIGEST_SIZE);
    pos += DIGEST_SIZE;
    e.increment = getU64(payload.data() + pos);
    pos += 8;
    e.hasContent =
        (std::to_integer<uint8_t>(payload[pos]) & FLAG_HAS_CONTENT) != 0;
    pos += 1;
    uint32_t len = getU32(payload.data() + pos);
    pos += 4;
    if (payload.size() - pos < len) {
      problem = "entry content past end of payload";
      return false;
    }
    e.content = payload.subspan(pos, len);
    pos += len;
    out.push_back(e);
  }
  if (pos != payload.size()) {
    problem = "trailing bytes after last entry";
    return false;
  }
  return true;
}

bool writeAll(int fd, const std::byte *data, size_t size) {
  while (size > 0) {
    ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

bool readAll(int fd, std::vector<std::byte> &out) {
  struct stat st;
  if (::fstat(fd, &st) != 0)
    return false;
  out.resize(static_cast<size_t>(st.st_size));
  size_t done = 0;
  while (done < out.size()) {
    ssize_t n = ::pread(fd, out.data() + done, out.size() - done,
                        static_cast<off_t>(done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (n == 0)
      break;
    done += static_cast<size_t>(n);
  }
  out.resize(done);
  return true;
}

std::string errnoText(int err) { return std::strerror(err); }

} // namespace

JournalChunkStore::JournalChunkStore(const std::string &path,
                                     JournalOptions options)
    : path_(path), options_(options) {
  try {
    openAndReplay();
  } catch (const std::exception &) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = -1;
    throw;
  }
}

JournalChunkStore::~JournalChunkStore() {
  if (fd_ >= 0)
    ::close(fd_);
}

void JournalChunkStore::openAndReplay() {
  std::filesystem::path parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
      throw StoreError("Cannot create directory " + parent.string() + ": " +
                       ec.message());
  }

  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd_ < 0)
    throw StoreError("Cannot open chunk journal " + path_ + ": " +
                     errnoText(errno));

  std::vector<std::byte> data;
  if (!readAll(fd_, data))
    throw StoreError("Cannot read chunk journal " + path_ + ": " +
                     errnoText(errno));

  const auto *magic = reinterpret_cast<const std::byte *>(FILE_MAGIC);
  if (data.size() < sizeof(FILE_MAGIC)) {
    // New file, or a crash while the header was being written.
    if (!std::equal(data.begin(), data.end(), magic))
      throw StoreError(path_ + " is not a chunk journal");
    if (::ftruncate(fd_, 0) != 0 ||
        !writeAll(fd_, magic, sizeof(FILE_MAGIC)) || ::fsync(fd_) != 0)
      throw StoreError("Cannot initialise chunk journal " + path_ + ": " +
                       errnoText(errno));
    journalSize_ = sizeof(FILE_MAGIC);
    compactedSize_ = journalSize_;
    Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                              "Created chunk journal " + path_);
    return;
  }
  if (!std::equal(magic, magic + sizeof(FILE_MAGIC), data.begin()))
    throw StoreError(path_ + " is not a chunk journal");

  replay(data);
  compactedSize_ = journalSize_;
  Logger::getInstance().log(
      LogLevel::INFO, COMPONENT,
      "Opened chunk journal " + path_ + ": " + std::to_string(index_.size()) +
          " chunks from " + std::to_string(recovery_.batchesReplayed) +
          " batches");
}

void JournalChunkStore::replay(const std::vector<std::byte> &data) {
  size_t pos = sizeof(FILE_MAGIC);
  std::string problem;
  while (pos < data.size()) {
    const size_t remaining = data.size() - pos;
    const std::byte *p = data.data() + pos;
    if (remaining < RECORD_HEADER) {
      problem = "torn record header";
      break;
    }
    if (getU32(p) != BATCH_MAGIC) {
      problem = "bad record magic";
      break;
    }
    const uint32_t entryCount = getU32(p + 4);
    const uint64_t payloadLen = getU64(p + 8);
    if (payloadLen > remaining - RECORD_HEADER ||
        remaining - RECORD_HEADER - payloadLen < DIGEST_SIZE) {
      problem = "torn record";
      break;
    }
    std::span<const std::byte> payload(p + RECORD_HEADER,
                                       static_cast<size_t>(payloadLen));
    ChunkHash stored;
    std::memcpy(stored.data(), p + RECORD_HEADER + payloadLen, DIGEST_SIZE);
    if (Digest::of(payload) != stored) {
      problem = "record checksum mismatch";
      break;
    }

    std::vector<JournalEntry> entries;
    if (!decodeEntries(payload, entryCount, entries, problem))
      break;

    std::unordered_set<ChunkHash, ChunkHashHasher> introduced;
    for (const auto &e : entries) {
      if (e.increment == 0) {
        problem = "zero increment";
        break;
      }
      if (e.hasContent) {
        introduced.insert(e.hash);
      } else if (!index_.contains(e.hash) && introduced.count(e.hash) == 0) {
        problem = "increment of unknown chunk " + toHex(e.hash);
        break;
      }
    }
    if (!problem.empty())
      break;

    for (const auto &e : entries)
      index_.add(e.hash, e.increment, e.content);
    pos += RECORD_HEADER + static_cast<size_t>(payloadLen) + DIGEST_SIZE;
    ++recovery_.batchesReplayed;
  }

  if (pos < data.size()) {
    recovery_.bytesDiscarded = data.size() - pos;
    Logger::getInstance().log(
        LogLevel::WARN, COMPONENT,
        "Discarding " + std::to_string(recovery_.bytesDiscarded) +
            " bytes at offset " + std::to_string(pos) + " of " + path_ +
            " (" + problem + ")");
    if (::ftruncate(fd_, static_cast<off_t>(pos)) != 0)
      throw StoreError("Cannot truncate chunk journal " + path_ + ": " +
                       errnoText(errno));
  }
  journalSize_ = pos;
}

void JournalChunkStore::appendOrRollback(const std::vector<std::byte> &record) {
  if (fd_ < 0)
    throw StoreError("Chunk journal " + path_ + " is not open");
  bool ok = writeAll(fd_, record.data(), record.size());
  if (ok && options_.syncWrites)
    ok = ::fdatasync(fd_) == 0;
  if (!ok) {
    const int err = errno;
    if (::ftruncate(fd_, static_cast<off_t>(journalSize_)) != 0) {
      Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                                "Rollback of partial batch in " + path_ +
                                    " failed: " + errnoText(errno));
    }
    throw StoreError("Failed to append batch to " + path_ + ": " +
                     errnoText(err));
  }
  journalSize_ += record.size();
}

std::vector<uint64_t>
JournalChunkStore::upsertBatch(const std::vector<UpsertItem> &batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (batch.empty())
    return {};

  std::vector<JournalEntry> entries;
  entries.reserve(batch.size());
  std::unordered_map<ChunkHash, uint64_t, ChunkHashHasher> running;
  std::vector<uint64_t> counts;
  counts.reserve(batch.size());

  for (const auto &item : batch) {
    auto it = running.find(item.hash);
    const uint64_t before =
        it != running.end() ? it->second : index_.count(item.hash);
    const bool isNew = before == 0;
    if (isNew && item.content.size() > std::numeric_limits<uint32_t>::max())
      throw StoreError("Chunk of " + std::to_string(item.content.size()) +
                       " bytes is too large for the journal");
    JournalEntry e;
    e.hash = item.hash;
    e.increment = 1;
    e.hasContent = isNew;
    if (isNew)
      e.content = item.content;
    entries.push_back(e);
    running[item.hash] = before + 1;
    counts.push_back(before + 1);
  }

  appendOrRollback(encodeRecord(entries));
  for (const auto &e : entries)
    index_.add(e.hash, e.increment, e.content);

  // Compact once the journal has doubled past its last compacted size.
  if (options_.compactAfterBytes > 0 &&
      journalSize_ > options_.compactAfterBytes &&
      journalSize_ > 2 * compactedSize_) {
    try {
      compactLocked();
    } catch (const StoreError &e) {
      // The batch itself is durable; compaction is retried on a later batch.
      Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                                std::string("Compaction failed: ") + e.what());
    }
  }
  return counts;
}

void JournalChunkStore::compact() {
  std::lock_guard<std::mutex> lock(mutex_);
  compactLocked();
}

void JournalChunkStore::compactLocked() {
  const std::string tmp = path_ + ".compact";
  int tfd = ::open(tmp.c_str(),
                   O_RDWR | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
  if (tfd < 0)
    throw StoreError("Cannot create " + tmp + ": " + errnoText(errno));

  auto fail = [&](const std::string &what) {
    const int err = errno;
    ::close(tfd);
    ::unlink(tmp.c_str());
    throw StoreError(what + ": " + errnoText(err));
  };

  uint64_t written = 0;
  const auto *magic = reinterpret_cast<const std::byte *>(FILE_MAGIC);
  if (!writeAll(tfd, magic, sizeof(FILE_MAGIC)))
    fail("Cannot write " + tmp);
  written += sizeof(FILE_MAGIC);

  for (const auto &kv : index_.entries()) {
    JournalEntry e;
    e.hash = kv.first;
    e.increment = kv.second.count;
    e.hasContent = true;
    e.content = kv.second.content;
    std::vector<std::byte> record = encodeRecord({e});
    if (!writeAll(tfd, record.data(), record.size()))
      fail("Cannot write " + tmp);
    written += record.size();
  }
  if (::fsync(tfd) != 0)
    fail("Cannot sync " + tmp);
  if (::rename(tmp.c_str(), path_.c_str()) != 0)
    fail("Cannot rename " + tmp + " to " + path_);

  std::filesystem::path parent = std::filesystem::path(path_).parent_path();
  int dfd = ::open(parent.empty() ? "." : parent.c_str(),
                   O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd >= 0) {
    ::fsync(dfd);
    ::close(dfd);
  }

  const uint64_t before = journalSize_;
  ::close(fd_);
  fd_ = tfd;
  journalSize_ = written;
  compactedSize_ = written;
  Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                            "Compacted " + path_ + " from " +
                                std::to_string(before) + " to " +
                                std::to_string(written) + " bytes");
}

std::vector<PopularChunk> JournalChunkStore::popularChunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.popular(POPULAR_MIN_COUNT);
}

uint64_t JournalChunkStore::occurrences(const ChunkHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(hash);
}

size_t JournalChunkStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.size();
}

uint64_t JournalChunkStore::journalBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return journalSize_;
}

} // namespace sharedict
