#include <gtest/gtest.h>
#include "rate_curve.hpp"
#include "pricing_errors.hpp"
#include <boost/make_shared.hpp>
#include <cmath>
#include <limits>

TEST(RateCurveTest, InterpolatesLinearlyBetweenPoints) {
    RateCurve curve({1.0, 2.0}, {0.02, 0.04});
    EXPECT_NEAR(curve.rate(1.5), 0.03, 1e-12);
    EXPECT_NEAR(curve.rate(1.25), 0.025, 1e-12);
}

TEST(RateCurveTest, ClampsOutsideTheGrid) {
    RateCurve curve({1.0, 2.0}, {0.02, 0.04});
    EXPECT_DOUBLE_EQ(curve.rate(0.0), 0.02);
    EXPECT_DOUBLE_EQ(curve.rate(0.5), 0.02);
    EXPECT_DOUBLE_EQ(curve.rate(3.0), 0.04);
    EXPECT_DOUBLE_EQ(curve.rate(100.0), 0.04);
}

TEST(RateCurveTest, IntegratesAcrossClampedAndInterpolatedRegions) {
    RateCurve curve({1.0, 2.0}, {0.02, 0.04});
    // 0.02 * 1 + 0.03 * 1 + 0.04 * 1
    EXPECT_NEAR(curve.integrated_rate(0.0, 3.0), 0.09, 1e-12);
    // 0.02 * 0.5 + 0.025 * 0.5
    EXPECT_NEAR(curve.integrated_rate(0.5, 1.5), 0.0225, 1e-12);
    EXPECT_NEAR(curve.discount_between(0.5, 1.5), std::exp(-0.0225), 1e-12);
}

TEST(RateCurveTest, DiscountFactorsComeFromTheIntegratedCurve) {
    auto curve = boost::make_shared<RateCurve>(std::vector<double>{0.0, 1.0}, std::vector<double>{0.0, 0.1});
    EXPECT_NEAR(curve->discount(1.0), std::exp(-0.05), 1e-12);
    EXPECT_NEAR(curve->discount(2.0), std::exp(-0.15), 1e-12);
    EXPECT_NEAR(curve->discount(0.0), 1.0, 1e-15);
}

TEST(RateCurveTest, SinglePointCurveIsFlat) {
    auto curve = make_flat_curve(0.05);
    EXPECT_DOUBLE_EQ(curve->rate(-1.0), 0.05);
    EXPECT_DOUBLE_EQ(curve->rate(7.0), 0.05);
    EXPECT_NEAR(curve->integrated_rate(0.25, 1.25), 0.05, 1e-12);
    EXPECT_NEAR(curve->discount(2.0), std::exp(-0.1), 1e-12);
}

TEST(RateCurveTest, RejectsMalformedCurves) {
    EXPECT_THROW(RateCurve({}, {}), InvalidInput);
    EXPECT_THROW(RateCurve({0.0, 1.0}, {0.05}), InvalidInput);
    EXPECT_THROW(RateCurve({0.0, 1.0, 1.0}, {0.01, 0.02, 0.03}), InvalidInput);
    EXPECT_THROW(RateCurve({1.0, 0.5}, {0.01, 0.02}), InvalidInput);
    EXPECT_THROW(RateCurve({0.0, std::numeric_limits<double>::quiet_NaN()}, {0.01, 0.02}), InvalidInput);
}

TEST(RateCurveTest, NaNLookupIsAnInterpolationError) {
    RateCurve curve({0.0, 1.0}, {0.01, 0.02});
    EXPECT_THROW(curve.rate(std::numeric_limits<double>::quiet_NaN()), InterpolationError);
}
