#include <gtest/gtest.h>
#include "european_option_pricer.hpp"
#include "pricing_errors.hpp"
#include <cmath>

TEST(IntrinsicValueTest, CallAndPutPayoffs) {
    EXPECT_DOUBLE_EQ(intrinsic_value(Option_Type::Call, 110.0, 100.0), 10.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(Option_Type::Call, 100.0, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(Option_Type::Call, 90.0, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(Option_Type::Put, 90.0, 100.0), 10.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(Option_Type::Put, 100.0, 100.0), 0.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(Option_Type::Put, 110.0, 100.0), 0.0);
}

TEST(BlackScholesTest, KnownValuesAndParity) {
    double call = price_black_scholes(Option_Type::Call, 100.0, 100.0, 1.0, 0.2, 0.05);
    double put = price_black_scholes(Option_Type::Put, 100.0, 100.0, 1.0, 0.2, 0.05);
    EXPECT_NEAR(call, 10.4506, 1e-3);
    EXPECT_NEAR(put, 5.5735, 1e-3);
    EXPECT_NEAR(call - put, 100.0 - 100.0 * std::exp(-0.05), 1e-10);
}

TEST(BlackScholesTest, RejectsNonPositiveExpiry) {
    EXPECT_THROW(price_black_scholes(Option_Type::Call, 100.0, 100.0, 0.0, 0.2, 0.05), InvalidInput);
}

TEST(BinomialTest, EuropeanConvergesToBlackScholes) {
    double lattice = price_binomial(Option_Type::Put, 100.0, 100.0, 1.0, 0.2, 0.05, 1000, false);
    EXPECT_NEAR(lattice, price_black_scholes(Option_Type::Put, 100.0, 100.0, 1.0, 0.2, 0.05), 0.01);
}

TEST(BinomialTest, AmericanPutCarriesAnEarlyExercisePremium) {
    double american = price_binomial(Option_Type::Put, 100.0, 100.0, 1.0, 0.2, 0.05, 500, true);
    double european = price_binomial(Option_Type::Put, 100.0, 100.0, 1.0, 0.2, 0.05, 500, false);
    EXPECT_GT(american, european);
    EXPECT_NEAR(american, 6.09, 0.03);

    // Sans dividende, le call américain vaut le call européen
    double american_call = price_binomial(Option_Type::Call, 100.0, 100.0, 1.0, 0.2, 0.05, 500, true);
    double european_call = price_binomial(Option_Type::Call, 100.0, 100.0, 1.0, 0.2, 0.05, 500, false);
    EXPECT_NEAR(american_call, european_call, 1e-10);
}

TEST(BinomialTest, RejectsZeroSteps) {
    EXPECT_THROW(price_binomial(Option_Type::Put, 100.0, 100.0, 1.0, 0.2, 0.05, 0, true), InvalidInput);
}
