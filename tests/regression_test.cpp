#include <gtest/gtest.h>
#include "regression.hpp"
#include "pricing_errors.hpp"
#include <cmath>

namespace {

    feature_vector point(double x) {
        feature_vector f(1);
        f(0) = x;
        return f;
    }

    feature_vector point(double x, double v) {
        feature_vector f(2);
        f(0) = x;
        f(1) = v;
        return f;
    }

}

TEST(LeastSquaresTest, RecoversAQuadraticExactly) {
    std::vector<Regression_Sample> samples;
    for (int i = 1; i <= 10; ++i) {
        double x = 80.0 + 2.0 * i;
        samples.push_back({point(x), 1.0 + 2.0 * x + 0.03 * x * x});
    }

    LeastSquaresEstimator estimator(2);
    auto model = estimator.fit(samples);
    EXPECT_NEAR(model->predict(point(91.0)), 1.0 + 182.0 + 0.03 * 91.0 * 91.0, 1e-6);
    EXPECT_NEAR(model->predict(point(80.0)), 1.0 + 160.0 + 0.03 * 6400.0, 1e-6);
}

TEST(LeastSquaresTest, DesignMatrixHoldsPowersOfSpot) {
    std::vector<feature_vector> features{point(2.0), point(3.0)};
    dlib::matrix<double> A = create_design_matrix(features, 2);
    ASSERT_EQ(A.nr(), 2);
    ASSERT_EQ(A.nc(), 3);
    EXPECT_DOUBLE_EQ(A(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(A(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(A(0, 2), 4.0);
    EXPECT_DOUBLE_EQ(A(1, 2), 9.0);
}

TEST(LeastSquaresTest, FitsSpotAndVarianceJointly) {
    std::vector<Regression_Sample> samples;
    for (int i = 0; i < 6; ++i) {
        for (int j = 0; j < 6; ++j) {
            double x = 90.0 + i;
            double v = 0.02 + 0.01 * j;
            samples.push_back({point(x, v), 3.0 - 0.5 * x + 40.0 * v + 2.0 * x * v});
        }
    }

    LeastSquaresEstimator estimator(2);
    auto model = estimator.fit(samples);
    EXPECT_NEAR(model->predict(point(92.5, 0.035)), 3.0 - 46.25 + 1.4 + 2.0 * 92.5 * 0.035, 1e-6);
}

TEST(LeastSquaresTest, TooFewDistinctSamplesIsARegressionError) {
    std::vector<Regression_Sample> samples;
    for (int i = 0; i < 10; ++i) {
        samples.push_back({point(i % 2 == 0 ? 90.0 : 95.0), 5.0});
    }
    LeastSquaresEstimator estimator(2);
    EXPECT_THROW(estimator.fit(samples), RegressionError);
    EXPECT_THROW(estimator.fit(std::vector<Regression_Sample>()), RegressionError);
}

TEST(LeastSquaresTest, CollinearFeaturesAreRankDeficient) {
    // Variance constante : colonne colinéaire à la constante
    std::vector<Regression_Sample> samples;
    for (int i = 0; i < 20; ++i) {
        samples.push_back({point(80.0 + i, 0.04), static_cast<double>(i)});
    }
    LeastSquaresEstimator estimator(2);
    EXPECT_THROW(estimator.fit(samples), RegressionError);
}

class RandomForestTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 500; ++i) {
            double x = 10.0 * i / 499.0;
            samples.push_back({point(x), x * x});
        }
    }

    std::vector<Regression_Sample> samples;
};

TEST_F(RandomForestTest, ApproximatesASmoothFunction) {
    RandomForestEstimator estimator(50, 5, 1.0, "forest-test");
    auto model = estimator.fit(samples);
    EXPECT_NEAR(model->predict(point(5.0)), 25.0, 3.0);
    EXPECT_NEAR(model->predict(point(2.0)), 4.0, 3.0);
    EXPECT_LT(model->predict(point(1.0)), model->predict(point(9.0)));
}

TEST_F(RandomForestTest, SameSeedSamePredictions) {
    RandomForestEstimator a(30, 5, 1.0, "seed");
    RandomForestEstimator b(30, 5, 1.0, "seed");
    auto model_a = a.fit(samples);
    auto model_b = b.fit(samples);
    for (double x : {0.5, 3.3, 7.1, 9.9}) {
        EXPECT_DOUBLE_EQ(model_a->predict(point(x)), model_b->predict(point(x)));
    }
}

TEST_F(RandomForestTest, FewerSamplesThanMinLeafIsARegressionError) {
    std::vector<Regression_Sample> few(samples.begin(), samples.begin() + 3);
    RandomForestEstimator estimator(10, 5, 1.0, "seed");
    EXPECT_THROW(estimator.fit(few), RegressionError);
}

TEST(ContinuationEstimatorFactoryTest, BuildsTheConfiguredVariant) {
    Regression_Config config;
    EXPECT_EQ(make_continuation_estimator(config)->name(), "least squares");

    config.method = Regression_Method::RandomForest;
    EXPECT_EQ(make_continuation_estimator(config)->name(), "random forest");
}

TEST(ContinuationEstimatorFactoryTest, RejectsInvalidConfiguration) {
    Regression_Config config;
    config.degree = 0;
    EXPECT_THROW(make_continuation_estimator(config), InvalidInput);

    config = Regression_Config();
    config.method = Regression_Method::RandomForest;
    config.num_trees = 0;
    EXPECT_THROW(make_continuation_estimator(config), InvalidInput);

    config = Regression_Config();
    config.feature_subsampling_fraction = 0.0;
    EXPECT_THROW(make_continuation_estimator(config), InvalidInput);
}
