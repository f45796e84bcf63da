#include "dojo/utils/Random.hh"
#include "gtest/gtest.h"
#include <vector>

class RandomTest : public ::testing::Test {};

TEST_F(RandomTest, SameSeedSameSequence) {
  dojo::Random a(1234);
  dojo::Random b(1234);

  for (int i = 0; i < 32; ++i) {
    EXPECT_FLOAT_EQ(a.uniform(400.0f, 900.0f), b.uniform(400.0f, 900.0f));
    EXPECT_EQ(a.chance(0.45f), b.chance(0.45f));
    EXPECT_EQ(a.index(3), b.index(3));
  }
}

TEST_F(RandomTest, ReseedRestartsSequence) {
  dojo::Random rng(77);
  std::vector<float> first;
  for (int i = 0; i < 8; ++i) {
    first.push_back(rng.unit());
  }

  rng.reseed(77);
  for (int i = 0; i < 8; ++i) {
    EXPECT_FLOAT_EQ(rng.unit(), first[i]);
  }
}

TEST_F(RandomTest, ZeroSeedResolvesToNonZero) {
  dojo::Random rng(0);
  EXPECT_NE(rng.seed(), 0u);
}

TEST_F(RandomTest, RangesRespected) {
  dojo::Random rng(5);
  for (int i = 0; i < 500; ++i) {
    float v = rng.uniform(700.0f, 1400.0f);
    EXPECT_GE(v, 700.0f);
    EXPECT_LT(v, 1400.0f);

    int idx = rng.index(3);
    EXPECT_GE(idx, 0);
    EXPECT_LT(idx, 3);
  }
  EXPECT_EQ(rng.index(1), 0);
  EXPECT_EQ(rng.index(0), 0);
}

TEST_F(RandomTest, ChanceExtremes) {
  dojo::Random rng(9);
  for (int i = 0; i < 100; ++i) {
    EXPECT_FALSE(rng.chance(0.0f));
    EXPECT_TRUE(rng.chance(1.0f));
  }
}
