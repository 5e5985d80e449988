#include <gtest/gtest.h>
#include <cmath>
#include "riskgate/statistics/normal_distribution.hpp"

using namespace riskgate::statistics;

class NormalDistributionTest : public ::testing::Test {};

TEST_F(NormalDistributionTest, DensityKnownValues) {
    EXPECT_NEAR(normal::pdf(0.0), 0.3989422804, 1e-10);
    EXPECT_NEAR(normal::pdf(1.0), 0.2419707245, 1e-10);
    EXPECT_DOUBLE_EQ(normal::pdf(-1.5), normal::pdf(1.5));
}

TEST_F(NormalDistributionTest, CumulativeKnownValues) {
    EXPECT_DOUBLE_EQ(normal::cdf(0.0), 0.5);
    EXPECT_NEAR(normal::cdf(1.96), 0.9750021049, 1e-9);
    EXPECT_NEAR(normal::cdf(-1.6448536270), 0.05, 1e-9);
}

TEST_F(NormalDistributionTest, QuantileTailValues) {
    EXPECT_NEAR(normal::ppf(0.05), -1.6448536270, 1e-9);
    EXPECT_NEAR(normal::ppf(0.01), -2.3263478740, 1e-9);
    EXPECT_NEAR(normal::ppf(0.975), 1.9599639845, 1e-9);
    EXPECT_NEAR(normal::ppf(0.5), 0.0, 1e-12);
}

TEST_F(NormalDistributionTest, QuantileInvertsCumulative) {
    for (double p : {1e-6, 0.001, 0.02425, 0.1, 0.3, 0.7, 0.9, 0.97575, 0.999}) {
        EXPECT_NEAR(normal::cdf(normal::ppf(p)), p, 1e-12 + p * 1e-9) << "p = " << p;
    }
}

TEST_F(NormalDistributionTest, QuantileBoundaries) {
    EXPECT_TRUE(std::isinf(normal::ppf(0.0)));
    EXPECT_LT(normal::ppf(0.0), 0.0);
    EXPECT_TRUE(std::isinf(normal::ppf(1.0)));
    EXPECT_GT(normal::ppf(1.0), 0.0);
    EXPECT_TRUE(std::isnan(normal::ppf(-0.2)));
    EXPECT_TRUE(std::isnan(normal::ppf(1.5)));
}
