#include "benchmarker/caching/CostCache.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace ionbench;

class CostCacheTest : public ::testing::Test {
protected:
    CostCache cache;
    Eigen::VectorXd x;

    void SetUp() override {
        x.resize(3);
        x << 0.1, -2.5, 1e-12;
    }
};

TEST_F(CostCacheTest, MissThenHit) {
    EXPECT_FALSE(cache.get(x).has_value());
    cache.set(x, 4.2);
    ASSERT_TRUE(cache.get(x).has_value());
    EXPECT_DOUBLE_EQ(*cache.get(x), 4.2);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.hits(), 2u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(CostCacheTest, KeysAreExactCoordinates) {
    cache.set(x, 1.0);
    Eigen::VectorXd y = x;
    y[0] = std::nextafter(y[0], 1.0);
    EXPECT_NE(cache.createCacheKey(x), cache.createCacheKey(y));
    EXPECT_FALSE(cache.get(y).has_value());

    Eigen::VectorXd copy = x;
    EXPECT_EQ(cache.createCacheKey(x), cache.createCacheKey(copy));
}

TEST_F(CostCacheTest, FirstWriteWins) {
    cache.set(x, 1.0);
    cache.set(x, 2.0);
    EXPECT_DOUBLE_EQ(*cache.get(x), 1.0);
}

TEST_F(CostCacheTest, ClearEmptiesCacheAndCounters) {
    cache.set(x, 1.0);
    cache.get(x);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.hits(), 0u);
    EXPECT_EQ(cache.misses(), 0u);
    EXPECT_FALSE(cache.get(x).has_value());
}
