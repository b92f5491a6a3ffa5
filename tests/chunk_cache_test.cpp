#include "../include/chunk_cache.hpp"

#include <arrow/api.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace pqlens {

namespace {

Chunk make_chunk(int64_t rows) {
  auto schema = arrow::schema({arrow::field("x", arrow::int64())});
  return arrow::Table::MakeEmpty(schema).ValueOrDie()->Slice(0, rows);
}

}  // namespace

TEST(ChunkCacheTest, MissThenHit) {
  ChunkCache cache(3);
  EXPECT_EQ(cache.get({0, 10}), nullptr);

  auto chunk = make_chunk(0);
  cache.put({0, 10}, chunk);
  EXPECT_EQ(cache.get({0, 10}), chunk);
  EXPECT_EQ(cache.stats().hits, 1u);
  EXPECT_EQ(cache.stats().misses, 1u);
}

TEST(ChunkCacheTest, ExactKeyOnly) {
  ChunkCache cache(3);
  cache.put({0, 20}, make_chunk(0));
  EXPECT_EQ(cache.get({5, 15}), nullptr);
  EXPECT_EQ(cache.get({0, 19}), nullptr);
  EXPECT_NE(cache.get({0, 20}), nullptr);
}

TEST(ChunkCacheTest, EvictsFirstInsertedWhenFull) {
  const size_t capacity = 10;
  ChunkCache cache(capacity);
  for (int64_t i = 0; i <= static_cast<int64_t>(capacity); ++i) {
    cache.put({i * 10, i * 10 + 10}, make_chunk(0));
    EXPECT_LE(cache.size(), capacity);
  }

  EXPECT_EQ(cache.size(), capacity);
  EXPECT_FALSE(cache.contains({0, 10}));
  for (int64_t i = 1; i <= static_cast<int64_t>(capacity); ++i) {
    EXPECT_NE(cache.get({i * 10, i * 10 + 10}), nullptr) << "key " << i;
  }
  EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST(ChunkCacheTest, LookupDoesNotRefreshEntry) {
  ChunkCache cache(2);
  cache.put({0, 1}, make_chunk(0));
  cache.put({1, 2}, make_chunk(0));

  // Recently read, still the oldest insertion
  ASSERT_NE(cache.get({0, 1}), nullptr);
  cache.put({2, 3}, make_chunk(0));

  EXPECT_FALSE(cache.contains({0, 1}));
  EXPECT_TRUE(cache.contains({1, 2}));
  EXPECT_TRUE(cache.contains({2, 3}));
}

TEST(ChunkCacheTest, RePutReplacesInPlace) {
  ChunkCache cache(2);
  auto first = make_chunk(0);
  auto replacement = make_chunk(0);
  cache.put({0, 1}, first);
  cache.put({1, 2}, make_chunk(0));
  cache.put({0, 1}, replacement);

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_EQ(cache.get({0, 1}), replacement);

  // {0, 1} kept its original slot and is still evicted first
  cache.put({2, 3}, make_chunk(0));
  EXPECT_FALSE(cache.contains({0, 1}));
  EXPECT_TRUE(cache.contains({1, 2}));
}

TEST(ChunkCacheTest, ClearEmptiesCache) {
  ChunkCache cache(4);
  cache.put({0, 1}, make_chunk(0));
  cache.put({1, 2}, make_chunk(0));
  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.get({0, 1}), nullptr);
}

TEST(ChunkCacheTest, ZeroCapacityRejected) {
  EXPECT_THROW(ChunkCache(0), std::invalid_argument);
}

}  // namespace pqlens
