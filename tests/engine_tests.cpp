#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "mocks/mock_chunk_store.h"
#include "mocks/mock_delta_codec.h"
#include "sharedict/engine.hpp"
#include "sharedict/zstd_delta_codec.hpp"
#include "test_helpers.hpp"

#include <future>
#include <map>
#include <thread>

using namespace sharedict;
using sharedict_test::bytesOf;
using sharedict_test::concat;
using sharedict_test::randomBytes;
using sharedict_test::ScratchDir;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

StageOptions stageOptions(const ScratchDir &dir) {
  StageOptions o;
  o.stagingPath = dir.file("dictraw");
  o.archiveDir = dir.file("dicts");
  o.syncWrites = false;
  return o;
}

class EngineTest : public ::testing::Test {
protected:
  EngineTest() : dir_("engine"), stage_(stageOptions(dir_)) {
    ON_CALL(codec_, name()).WillByDefault(Return("mock"));
    ON_CALL(codec_, encode(_, _)).WillByDefault(Return(bytesOf("diff")));
  }

  ScratchDir dir_;
  DictionaryStage stage_;
  MemoryChunkStore store_;
  NiceMock<MockDeltaCodec> codec_;
};

} // namespace

TEST_F(EngineTest, ReturnsCodecOutputAndLearnsContent) {
  Engine engine(store_, stage_, codec_);
  const auto content = randomBytes(2048, 1);
  EXPECT_EQ(engine.ingest(content), bytesOf("diff"));
  engine.drain();
  EXPECT_GT(store_.size(), 0u);
  EXPECT_EQ(engine.stats().totalBytesIngested.load(), content.size());
  EXPECT_EQ(engine.stats().ingestions.load(), 1u);
}

TEST_F(EngineTest, EncodesAgainstTheCurrentRevision) {
  stage_.publish(bytesOf("published dictionary"));
  EXPECT_CALL(codec_, encode(_, Field(&DictionaryRevision::serial, 1u)))
      .WillOnce(Return(bytesOf("d")));
  Engine engine(store_, stage_, codec_);
  engine.ingest(bytesOf("content"));
}

TEST_F(EngineTest, CodecFailureLeavesStoreUntouched) {
  EXPECT_CALL(codec_, encode(_, _))
      .WillOnce(Throw(DeltaError("tool crashed")))
      .WillOnce(Throw(std::runtime_error("unexpected")));
  Engine engine(store_, stage_, codec_);
  EXPECT_THROW(engine.ingest(randomBytes(1000, 2)), DeltaError);
  EXPECT_THROW(engine.ingest(randomBytes(1000, 3)), DeltaError);
  engine.drain();
  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(engine.stats().encodeFailures.load(), 2u);
  EXPECT_EQ(engine.stats().ingestions.load(), 0u);
  EXPECT_EQ(engine.stats().totalBytesIngested.load(), 0u);
}

TEST_F(EngineTest, RepeatedIngestionCountsEveryChunk) {
  Engine engine(store_, stage_, codec_);
  const auto content = randomBytes(4096, 4);
  const int n = 5;
  for (int i = 0; i < n; ++i)
    engine.ingest(content);
  engine.drain();

  std::map<ChunkHash, uint64_t> perContent;
  for (const auto &c : engine.chunker().chunk(content))
    ++perContent[c.hash];
  for (const auto &kv : perContent)
    EXPECT_EQ(store_.occurrences(kv.first), n * kv.second);
  EXPECT_EQ(engine.stats().totalBytesIngested.load(), n * content.size());
}

TEST_F(EngineTest, DuplicateBytesCountChunksSeenBefore) {
  Engine engine(store_, stage_, codec_);
  const auto content = randomBytes(4096, 5);
  engine.ingest(content);
  engine.drain();
  const uint64_t first = engine.stats().totalBytesMatchedAsDuplicate.load();
  EXPECT_LT(first, content.size());

  engine.ingest(content);
  engine.drain();
  EXPECT_EQ(engine.stats().totalBytesMatchedAsDuplicate.load(),
            first + content.size());
  EXPECT_EQ(engine.statsLine(),
            "matched " + std::to_string(first + content.size()) + " out of " +
                std::to_string(2 * content.size()));
}

TEST_F(EngineTest, StoreFailureIsContained) {
  NiceMock<MockChunkStore> store;
  EXPECT_CALL(store, upsertBatch(_))
      .WillOnce(Throw(StoreError("journal full")));
  EXPECT_CALL(store, popularChunks()).Times(0);
  Engine engine(store, stage_, codec_);
  EXPECT_EQ(engine.ingest(randomBytes(512, 6)), bytesOf("diff"));
  engine.drain();
  EXPECT_EQ(engine.stats().ingestions.load(), 0u);
  EXPECT_EQ(engine.stats().dictionaryRebuilds.load(), 0u);
}

TEST_F(EngineTest, FullQueueDropsIngestion) {
  NiceMock<MockChunkStore> store;
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  EXPECT_CALL(store, upsertBatch(_))
      .WillOnce(Invoke([gate](const std::vector<UpsertItem> &batch) {
        gate.wait();
        return std::vector<uint64_t>(batch.size(), 1);
      }));
  ON_CALL(store, popularChunks())
      .WillByDefault(Return(std::vector<PopularChunk>{}));

  EngineOptions options;
  options.queueCapacity = 1;
  Engine engine(store, stage_, codec_, options);
  EXPECT_EQ(engine.ingest(bytesOf("first")), bytesOf("diff"));
  EXPECT_EQ(engine.ingest(bytesOf("second")), bytesOf("diff"));
  release.set_value();
  engine.drain();
  EXPECT_EQ(engine.stats().droppedIngestions.load(), 1u);
  EXPECT_EQ(engine.stats().ingestions.load(), 1u);
}

TEST_F(EngineTest, ConcurrentCallersAreAllCounted) {
  Engine engine(store_, stage_, codec_);
  const int threads = 4, perThread = 50;
  std::vector<std::thread> pool;
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&engine, t]() {
      for (int i = 0; i < perThread; ++i)
        engine.ingest(randomBytes(256, static_cast<uint32_t>(t * 1000 + i)));
    });
  }
  for (auto &th : pool)
    th.join();
  engine.drain();
  EXPECT_EQ(engine.stats().ingestions.load(),
            static_cast<uint64_t>(threads * perThread));
  EXPECT_EQ(engine.stats().totalBytesIngested.load(),
            static_cast<uint64_t>(threads * perThread * 256));
  EXPECT_EQ(engine.stats().droppedIngestions.load(), 0u);
}

TEST_F(EngineTest, StoppedEngineStillEncodes) {
  Engine engine(store_, stage_, codec_);
  engine.stop();
  EXPECT_EQ(engine.ingest(bytesOf("late")), bytesOf("diff"));
  EXPECT_EQ(engine.stats().droppedIngestions.load(), 1u);
}

TEST(EngineIntegrationTest, LearnedDictionaryShrinksDiffs) {
  ScratchDir dir("engine_integration");
  MemoryChunkStore store;
  DictionaryStage stage(stageOptions(dir));
  ZstdDeltaCodec codec;
  Engine engine(store, stage, codec);

  const auto s = randomBytes(8192, 100);
  const auto t = randomBytes(8192, 200);
  engine.ingest(s);
  engine.ingest(s);
  engine.ingest(t);
  engine.ingest(t);
  engine.drain();

  EXPECT_GE(engine.stats().dictionaryRebuilds.load(), 1u);
  auto rev = stage.current();
  EXPECT_EQ(rev->serial, engine.stats().dictionaryRebuilds.load());
  EXPECT_FALSE(engine.builder().activeHashes().empty());

  const auto page = concat(s, t);
  auto diff = engine.ingest(page);
  EXPECT_LT(diff.size(), page.size() / 3);
  EXPECT_EQ(codec.decode(diff, *rev), page);
  engine.drain();
}
