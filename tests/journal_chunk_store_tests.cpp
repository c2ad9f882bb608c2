#include "gtest/gtest.h"
#include "sharedict/journal_chunk_store.hpp"
#include "test_helpers.hpp"

#include <csignal>
#include <filesystem>
#include <fstream>

#include <sys/resource.h>

using namespace sharedict;
using sharedict_test::bytesOf;
using sharedict_test::ScratchDir;

namespace {

JournalOptions fastOptions() {
  JournalOptions o;
  o.syncWrites = false;
  o.compactAfterBytes = 0;
  return o;
}

void appendRaw(const std::string &path, const std::string &bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  out << bytes;
}

// Caps the size of files this process may write for the lifetime of the
// object. Writes past the cap fail with EFBIG instead of raising SIGXFSZ.
class FileSizeCap {
public:
  explicit FileSizeCap(rlim_t bytes) {
    if (getrlimit(RLIMIT_FSIZE, &saved_) != 0)
      return;
    oldHandler_ = std::signal(SIGXFSZ, SIG_IGN);
    rlimit capped = saved_;
    capped.rlim_cur = bytes;
    active_ = setrlimit(RLIMIT_FSIZE, &capped) == 0;
  }
  ~FileSizeCap() {
    if (active_)
      setrlimit(RLIMIT_FSIZE, &saved_);
    if (oldHandler_ != SIG_ERR)
      std::signal(SIGXFSZ, oldHandler_);
  }
  bool active() const { return active_; }

private:
  rlimit saved_{};
  void (*oldHandler_)(int) = SIG_ERR;
  bool active_ = false;
};

} // namespace

TEST(JournalChunkStoreTest, CreatesEmptyJournal) {
  ScratchDir dir("journal_create");
  JournalChunkStore store(dir.file("chunks.journal"), fastOptions());
  EXPECT_EQ(store.size(), 0u);
  EXPECT_EQ(store.journalBytes(), 4u);
  EXPECT_TRUE(std::filesystem::exists(dir.file("chunks.journal")));
}

TEST(JournalChunkStoreTest, CountsSurviveReopen) {
  ScratchDir dir("journal_reopen");
  auto a = bytesOf("alpha chunk");
  auto b = bytesOf("beta chunk");
  ChunkHash ha = Digest::of(a), hb = Digest::of(b);
  {
    JournalChunkStore store(dir.file("chunks.journal"), fastOptions());
    for (int i = 0; i < 3; ++i)
      store.upsertBatch({{ha, a}, {hb, b}});
    store.upsert(ha, a);
  }
  JournalChunkStore reopened(dir.file("chunks.journal"), fastOptions());
  EXPECT_EQ(reopened.occurrences(ha), 4u);
  EXPECT_EQ(reopened.occurrences(hb), 3u);
  EXPECT_EQ(reopened.recovery().batchesReplayed, 4u);
  EXPECT_EQ(reopened.recovery().bytesDiscarded, 0u);

  auto popular = reopened.popularChunks();
  ASSERT_EQ(popular.size(), 2u);
  EXPECT_EQ(popular[0].hash, hb);
  EXPECT_EQ(popular[0].content, b);
  EXPECT_EQ(popular[1].hash, ha);
  EXPECT_EQ(popular[1].content, a);
}

TEST(JournalChunkStoreTest, RepeatedHashInOneBatchSurvivesReopen) {
  ScratchDir dir("journal_repeat");
  auto a = bytesOf("dup");
  ChunkHash ha = Digest::of(a);
  {
    JournalChunkStore store(dir.file("chunks.journal"), fastOptions());
    auto counts = store.upsertBatch({{ha, a}, {ha, a}});
    EXPECT_EQ(counts, (std::vector<uint64_t>{1, 2}));
  }
  JournalChunkStore reopened(dir.file("chunks.journal"), fastOptions());
  EXPECT_EQ(reopened.occurrences(ha), 2u);
}

TEST(JournalChunkStoreTest, EmptyChunkContentIsStored) {
  ScratchDir dir("journal_empty_chunk");
  std::vector<std::byte> empty;
  ChunkHash h = Digest::of(empty);
  {
    JournalChunkStore store(dir.file("chunks.journal"), fastOptions());
    store.upsert(h, empty);
  }
  JournalChunkStore reopened(dir.file("chunks.journal"), fastOptions());
  EXPECT_EQ(reopened.occurrences(h), 1u);
}

TEST(JournalChunkStoreTest, TornTailIsDiscarded) {
  ScratchDir dir("journal_torn");
  const std::string path = dir.file("chunks.journal");
  auto a = bytesOf("survivor");
  ChunkHash ha = Digest::of(a);
  uint64_t goodSize = 0;
  {
    JournalChunkStore store(path, fastOptions());
    store.upsert(ha, a);
    store.upsert(ha, a);
    goodSize = store.journalBytes();
  }
  // Half a record header followed by garbage.
  appendRaw(path, std::string("BTCH\x05\x00\x00", 7));

  JournalChunkStore reopened(path, fastOptions());
  EXPECT_EQ(reopened.occurrences(ha), 2u);
  EXPECT_EQ(reopened.recovery().bytesDiscarded, 7u);
  EXPECT_EQ(std::filesystem::file_size(path), goodSize);

  // The truncated journal accepts new batches.
  reopened.upsert(ha, a);
  EXPECT_EQ(reopened.occurrences(ha), 3u);
}

TEST(JournalChunkStoreTest, CorruptRecordStopsReplay) {
  ScratchDir dir("journal_corrupt");
  const std::string path = dir.file("chunks.journal");
  auto a = bytesOf("first batch");
  auto b = bytesOf("second batch");
  uint64_t firstSize = 0;
  {
    JournalChunkStore store(path, fastOptions());
    store.upsert(Digest::of(a), a);
    firstSize = store.journalBytes();
    store.upsert(Digest::of(b), b);
  }
  {
    // Flip one byte inside the second record's payload.
    std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
    f.seekp(static_cast<std::streamoff>(firstSize + 16 + 40));
    f.put('\x7f');
  }
  JournalChunkStore reopened(path, fastOptions());
  EXPECT_EQ(reopened.occurrences(Digest::of(a)), 1u);
  EXPECT_EQ(reopened.occurrences(Digest::of(b)), 0u);
  EXPECT_EQ(reopened.recovery().batchesReplayed, 1u);
  EXPECT_EQ(std::filesystem::file_size(path), firstSize);
}

TEST(JournalChunkStoreTest, RejectsForeignFile) {
  ScratchDir dir("journal_foreign");
  const std::string path = dir.file("chunks.journal");
  appendRaw(path, "definitely not a journal");
  EXPECT_THROW(JournalChunkStore(path, fastOptions()), StoreError);
}

TEST(JournalChunkStoreTest, CompactionKeepsCountsAndShrinks) {
  ScratchDir dir("journal_compact");
  const std::string path = dir.file("chunks.journal");
  auto a = bytesOf("compact me");
  ChunkHash ha = Digest::of(a);
  {
    JournalChunkStore store(path, fastOptions());
    for (int i = 0; i < 50; ++i)
      store.upsert(ha, a);
    const uint64_t before = store.journalBytes();
    store.compact();
    EXPECT_LT(store.journalBytes(), before);
    EXPECT_EQ(store.journalBytes(), std::filesystem::file_size(path));
    EXPECT_EQ(store.occurrences(ha), 50u);
    // Appends go to the compacted file.
    store.upsert(ha, a);
  }
  EXPECT_FALSE(std::filesystem::exists(path + ".compact"));
  JournalChunkStore reopened(path, fastOptions());
  EXPECT_EQ(reopened.occurrences(ha), 51u);
  EXPECT_EQ(reopened.recovery().batchesReplayed, 2u);
}

TEST(JournalChunkStoreTest, AutomaticCompaction) {
  ScratchDir dir("journal_auto_compact");
  const std::string path = dir.file("chunks.journal");
  JournalOptions o = fastOptions();
  o.compactAfterBytes = 2048;
  auto a = bytesOf("auto");
  ChunkHash ha = Digest::of(a);
  JournalChunkStore store(path, o);
  for (int i = 0; i < 200; ++i)
    store.upsert(ha, a);
  EXPECT_LT(store.journalBytes(), 200u * 64u);
  EXPECT_EQ(store.occurrences(ha), 200u);
}

TEST(JournalChunkStoreTest, FailedAppendLeavesStoreAtPreBatchState) {
  ScratchDir dir("journal_failed_append");
  const std::string path = dir.file("chunks.journal");
  auto a = bytesOf("already stored");
  auto b = sharedict_test::randomBytes(4096, 7);
  ChunkHash ha = Digest::of(a), hb = Digest::of(b);

  JournalChunkStore store(path, fastOptions());
  store.upsert(ha, a);
  const uint64_t bytesBefore = store.journalBytes();
  const size_t sizeBefore = store.size();

  bool threw = false;
  {
    // Room for part of the record only, so the append is cut short.
    FileSizeCap cap(bytesBefore + 64);
    ASSERT_TRUE(cap.active());
    try {
      store.upsertBatch({{ha, a}, {hb, b}});
    } catch (const StoreError &) {
      threw = true;
    }
  }
  EXPECT_TRUE(threw);
  EXPECT_EQ(store.occurrences(ha), 1u);
  EXPECT_EQ(store.occurrences(hb), 0u);
  EXPECT_EQ(store.size(), sizeBefore);
  EXPECT_EQ(store.journalBytes(), bytesBefore);
  EXPECT_EQ(std::filesystem::file_size(path), bytesBefore);

  // The store keeps working after the failure.
  EXPECT_EQ(store.upsert(ha, a), 2u);

  JournalChunkStore reopened(path, fastOptions());
  EXPECT_EQ(reopened.occurrences(ha), 2u);
  EXPECT_EQ(reopened.occurrences(hb), 0u);
  EXPECT_EQ(reopened.recovery().bytesDiscarded, 0u);
}
