// test_zero_point_cache.cpp - per-filter AB zero-point memoisation

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "sedphot/ZeroPointCache.hpp"
#include "sedphot/Photometry.hpp"

using namespace sedphot;

namespace {

FilterCurve box(double lo, double hi, const std::string& name = "box")
{
    FilterCurve f;
    f.name  = name;
    f.wave  = Vector::LinSpaced(64, lo, hi);
    f.trans = Vector::Constant(64, 0.8);
    return f;
}

class ZeroPointCacheTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ZeroPointCache::instance().clear();
        ZeroPointCache::instance().set_capacity(256);
    }
    void TearDown() override { ZeroPointCache::instance().clear(); }
};

TEST_F(ZeroPointCacheTest, ReturnsTheIntegratedZeroPoint) {
    const FilterCurve f = box(4000.0, 5000.0);
    auto& cache = ZeroPointCache::instance();

    EXPECT_FALSE(cache.contains(f));
    EXPECT_DOUBLE_EQ(cache.get(f), flux_ab0_at_10pc(f));
    EXPECT_TRUE(cache.contains(f));
    EXPECT_DOUBLE_EQ(cache.get(f), flux_ab0_at_10pc(f));
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ZeroPointCacheTest, KeyedByCurveNotName) {
    const FilterCurve a = box(4000.0, 5000.0, "g");
    const FilterCurve b = box(4000.0, 5000.0, "g_copy");
    const FilterCurve c = box(4000.0, 5001.0, "g");

    EXPECT_EQ(filter_hash(a), filter_hash(b));
    EXPECT_NE(filter_hash(a), filter_hash(c));

    auto& cache = ZeroPointCache::instance();
    cache.get(a);
    EXPECT_TRUE(cache.contains(b));
    EXPECT_FALSE(cache.contains(c));
}

TEST_F(ZeroPointCacheTest, ResampledCurveGetsItsOwnEntry) {
    FilterCurve coarse = box(4000.0, 5000.0);
    FilterCurve fine;
    fine.name  = coarse.name;
    fine.wave  = Vector::LinSpaced(640, 4000.0, 5000.0);
    fine.trans = Vector::Constant(640, 0.8);

    auto& cache = ZeroPointCache::instance();
    const double zp_coarse = cache.get(coarse);
    EXPECT_FALSE(cache.contains(fine));

    const double zp_fine = cache.get(fine);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_DOUBLE_EQ(zp_fine,   flux_ab0_at_10pc(fine));
    EXPECT_DOUBLE_EQ(cache.get(coarse), zp_coarse);
    EXPECT_DOUBLE_EQ(cache.get(fine),   zp_fine);
}

TEST_F(ZeroPointCacheTest, EvictsLeastRecentlyUsed) {
    auto& cache = ZeroPointCache::instance();
    cache.set_capacity(2);

    const FilterCurve a = box(3000.0, 4000.0);
    const FilterCurve b = box(4000.0, 5000.0);
    const FilterCurve c = box(5000.0, 6000.0);

    cache.get(a);
    cache.get(b);
    cache.get(a);          // b is now the oldest
    cache.get(c);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains(a));
    EXPECT_FALSE(cache.contains(b));
    EXPECT_TRUE(cache.contains(c));
}

TEST_F(ZeroPointCacheTest, ConcurrentLookupsAgree) {
    const FilterCurve f = box(6000.0, 7500.0);
    const double expected = flux_ab0_at_10pc(f);

    std::vector<double> seen(8, 0.0);
    {
        std::vector<std::jthread> workers;
        for (std::size_t t = 0; t < seen.size(); ++t)
            workers.emplace_back([&, t] { seen[t] = ZeroPointCache::instance().get(f); });
    }
    for (double v : seen) EXPECT_DOUBLE_EQ(v, expected);
    EXPECT_EQ(ZeroPointCache::instance().size(), 1u);
}

} // namespace
