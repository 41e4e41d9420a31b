#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include "shard/reed_solomon.hpp"
#include "store/storage_error.hpp"
#include "test_utils.hpp"

using namespace blobshard;
using namespace blobshard::shard;

class ReedSolomonTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
  }

  static std::vector<Bytes> make_shards(const ReedSolomon& rs, size_t shard_size, uint32_t seed) {
    std::vector<Bytes> shards;
    for (size_t i = 0; i < rs.data_shards(); ++i) {
      shards.push_back(test::random_bytes(shard_size, seed + static_cast<uint32_t>(i)));
    }
    for (size_t i = 0; i < rs.parity_shards(); ++i) {
      shards.emplace_back(shard_size, 0);
    }
    rs.encode(shards);
    return shards;
  }

  // Every subset of {0..n-1} with exactly k members
  static std::vector<std::vector<size_t>> combinations(size_t n, size_t k) {
    std::vector<std::vector<size_t>> result;
    std::vector<size_t> current;
    std::function<void(size_t)> recurse = [&](size_t start) {
      if (current.size() == k) {
        result.push_back(current);
        return;
      }
      for (size_t i = start; i < n; ++i) {
        current.push_back(i);
        recurse(i + 1);
        current.pop_back();
      }
    };
    recurse(0);
    return result;
  }
};

TEST_F(ReedSolomonTest, EncodeIsSystematic) {
  ReedSolomon rs(4, 3);
  std::vector<Bytes> original;
  for (uint32_t i = 0; i < 4; ++i) {
    original.push_back(test::random_bytes(64, i));
  }

  std::vector<Bytes> shards = make_shards(rs, 64, 0);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(shards[i], original[i]);
  }
  EXPECT_TRUE(rs.verify(shards));
}

TEST_F(ReedSolomonTest, VerifyDetectsCorruption) {
  ReedSolomon rs(5, 2);
  std::vector<Bytes> shards = make_shards(rs, 100, 9);
  ASSERT_TRUE(rs.verify(shards));

  shards[2][17] ^= 0x40;
  EXPECT_FALSE(rs.verify(shards));
}

TEST_F(ReedSolomonTest, ToleratesAnyParityLosses) {
  ReedSolomon rs(4, 3);
  const std::vector<Bytes> original = make_shards(rs, 50, 100);

  for (size_t lost = 1; lost <= 3; ++lost) {
    for (const auto& dropped : combinations(7, lost)) {
      std::vector<Bytes> shards = original;
      std::vector<bool> present(7, true);
      for (size_t index : dropped) {
        shards[index].assign(50, 0);
        present[index] = false;
      }

      rs.reconstruct(shards, present);
      EXPECT_EQ(shards, original);
      EXPECT_EQ(std::count(present.begin(), present.end(), true), 7);
    }
  }
}

TEST_F(ReedSolomonTest, ReconstructDataLeavesParityAlone) {
  ReedSolomon rs(4, 3);
  const std::vector<Bytes> original = make_shards(rs, 32, 7);

  std::vector<Bytes> shards = original;
  std::vector<bool> present(7, true);
  for (size_t index : {0u, 3u, 5u}) {
    shards[index].clear();
    present[index] = false;
  }

  rs.reconstruct_data(shards, present);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(shards[i], original[i]) << i;
    EXPECT_TRUE(present[i]) << i;
  }
  EXPECT_FALSE(present[5]);
}

TEST_F(ReedSolomonTest, TooManyLosses) {
  ReedSolomon rs(4, 3);
  std::vector<Bytes> shards = make_shards(rs, 16, 1);
  std::vector<bool> present = {true, false, true, false, false, true, false};

  EXPECT_THROW(rs.reconstruct(shards, present), store::InvalidDataError);
}

TEST_F(ReedSolomonTest, WideConfiguration) {
  ReedSolomon rs(17, 9);
  const std::vector<Bytes> original = make_shards(rs, 20, 55);

  std::vector<Bytes> shards = original;
  std::vector<bool> present(26, true);
  for (size_t index : {0u, 2u, 4u, 6u, 8u, 10u, 12u, 20u, 25u}) {
    shards[index].assign(20, 0);
    present[index] = false;
  }
  rs.reconstruct(shards, present);
  EXPECT_EQ(shards, original);
}

TEST_F(ReedSolomonTest, NoParity) {
  ReedSolomon rs(3, 0);
  std::vector<Bytes> shards = make_shards(rs, 8, 2);
  EXPECT_TRUE(rs.verify(shards));

  std::vector<bool> present(3, true);
  EXPECT_NO_THROW(rs.reconstruct(shards, present));
}

TEST_F(ReedSolomonTest, InvalidParameters) {
  EXPECT_THROW(ReedSolomon(0, 3), store::InvalidDataError);
  EXPECT_THROW(ReedSolomon(200, 57), store::InvalidDataError);
  EXPECT_NO_THROW(ReedSolomon(200, 55));
}

TEST_F(ReedSolomonTest, ShapeErrors) {
  ReedSolomon rs(4, 2);
  std::vector<Bytes> wrong_count(5, Bytes(8, 0));
  EXPECT_THROW(rs.encode(wrong_count), store::InvalidDataError);

  std::vector<Bytes> uneven(6, Bytes(8, 0));
  uneven[3].resize(9);
  EXPECT_THROW(rs.encode(uneven), store::InvalidDataError);
}
