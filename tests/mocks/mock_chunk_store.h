#ifndef TESTS_MOCKS_MOCK_CHUNK_STORE_H
#define TESTS_MOCKS_MOCK_CHUNK_STORE_H

#include <gmock/gmock.h>
#include "sharedict/chunk_store.hpp"

class MockChunkStore : public sharedict::ChunkStore {
public:
  MOCK_METHOD(std::vector<uint64_t>, upsertBatch,
              (const std::vector<sharedict::UpsertItem> &batch), (override));
  MOCK_METHOD(std::vector<sharedict::PopularChunk>, popularChunks, (),
              (const, override));
  MOCK_METHOD(uint64_t, occurrences, (const sharedict::ChunkHash &hash),
              (const, override));
  MOCK_METHOD(size_t, size, (), (const, override));
};

#endif // TESTS_MOCKS_MOCK_CHUNK_STORE_H
