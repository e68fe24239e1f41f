#include "regression.hpp"
#include "pricing_errors.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <set>
#include <sstream>

namespace {

    long basis_size(long dim, int degree) {
        if (dim == 1) return degree + 1;
        return (degree + 1) * (degree + 2) / 2;
    }

    void check_dimension(long dim, const char* stage) {
        if (dim != 1 && dim != 2) {
            std::ostringstream msg;
            msg << "feature dimension must be 1 (spot) or 2 (spot, variance), got " << dim;
            throw RegressionError(stage, msg.str());
        }
    }

}

// #############################################################################
// #                     RÉGRESSION POLYNOMIALE (MOINDRES CARRÉS)              #
// #############################################################################

dlib::matrix<double, 1, 0> basis_functions(const feature_vector& feature, int degree) {
    const long dim = feature.size();
    dlib::matrix<double, 1, 0> row(basis_size(dim, degree));
    long col = 0;
    if (dim == 1) {
        double s = feature(0);
        double power = 1.0;
        for (int d = 0; d <= degree; ++d) {
            row(col++) = power;
            power *= s;
        }
        return row;
    }
    // Dimension 2 : monômes x^a y^b rangés par degré total (1, x, y, x^2, xy, y^2, ...)
    double x = feature(0);
    double y = feature(1);
    for (int d = 0; d <= degree; ++d) {
        for (int a = d; a >= 0; --a) {
            row(col++) = std::pow(x, a) * std::pow(y, d - a);
        }
    }
    return row;
}

dlib::matrix<double> create_design_matrix(const std::vector<feature_vector>& features, int degree) {
    const long n = static_cast<long>(features.size());
    const long dim = n > 0 ? features[0].size() : 1;
    dlib::matrix<double> A(n, basis_size(dim, degree));
    for (long i = 0; i < n; ++i) {
        dlib::set_rowm(A, i) = basis_functions(features[i], degree);
    }
    return A;
}

double LeastSquaresModel::predict(const feature_vector& feature) const {
    feature_vector scaled = dlib::pointwise_divide(feature, scales_);
    return dlib::dot(basis_functions(scaled, degree_), coefficients_);
}

LeastSquaresEstimator::LeastSquaresEstimator(int degree) : degree_(degree) {
    if (degree < 1)
        throw InvalidInput("least squares", "polynomial degree must be >= 1");
}

std::unique_ptr<ContinuationModel> LeastSquaresEstimator::fit(const std::vector<Regression_Sample>& samples) const {
    if (samples.empty())
        throw RegressionError("least squares", "no samples to fit");

    const long dim = samples[0].feature.size();
    check_dimension(dim, "least squares");
    const long num_basis = basis_size(dim, degree_);

    // Mise à l'échelle des variables pour le conditionnement de la matrice
    feature_vector scales = dlib::ones_matrix<double>(dim, 1);
    std::set<std::vector<double>> distinct;
    for (const auto& s : samples) {
        if (s.feature.size() != dim)
            throw RegressionError("least squares", "inconsistent feature dimensions");
        for (long k = 0; k < dim; ++k) {
            scales(k) = std::max(scales(k), std::abs(s.feature(k)));
        }
        distinct.insert(std::vector<double>(s.feature.begin(), s.feature.end()));
    }

    if (static_cast<long>(distinct.size()) < num_basis) {
        std::ostringstream msg;
        msg << distinct.size() << " distinct samples, at least " << num_basis
            << " required for degree " << degree_;
        throw RegressionError("least squares", msg.str());
    }

    std::vector<feature_vector> features;
    features.reserve(samples.size());
    dlib::matrix<double, 0, 1> b(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        features.push_back(dlib::pointwise_divide(samples[i].feature, scales));
        b(i) = samples[i].target;
    }
    dlib::matrix<double> A = create_design_matrix(features, degree_);

    dlib::matrix<double> u, v;
    dlib::matrix<double, 0, 1> w;
    dlib::svd3(A, u, w, v);

    double w_max = dlib::max(w);
    long rank = 0;
    for (long k = 0; k < w.size(); ++k) {
        if (w(k) > 1e-10 * w_max) ++rank;
    }
    if (w_max <= 0.0 || rank < num_basis) {
        std::ostringstream msg;
        msg << "design matrix is rank deficient (rank " << rank << " < " << num_basis << ")";
        throw RegressionError("least squares", msg.str());
    }

    dlib::matrix<double, 0, 1> beta = v * dlib::diagm(dlib::reciprocal(w)) * dlib::trans(u) * b;
    if (!dlib::is_finite(beta))
        throw RegressionError("least squares", "non-finite regression coefficients");

    return std::make_unique<LeastSquaresModel>(beta, scales, degree_);
}

// #############################################################################
// #                      FORÊT ALÉATOIRE D'ARBRES DE RÉGRESSION                 #
// #############################################################################

RandomForestEstimator::RandomForestEstimator(unsigned long num_trees, unsigned long min_samples_per_leaf,
                                             double feature_subsampling_fraction, const std::string& seed)
    : num_trees_(num_trees), min_samples_per_leaf_(min_samples_per_leaf),
      feature_subsampling_fraction_(feature_subsampling_fraction), seed_(seed) {
    if (num_trees_ < 1)
        throw InvalidInput("random forest", "num_trees must be >= 1");
    if (min_samples_per_leaf_ < 1)
        throw InvalidInput("random forest", "min_samples_per_leaf must be >= 1");
    if (!(feature_subsampling_fraction_ > 0.0 && feature_subsampling_fraction_ <= 1.0))
        throw InvalidInput("random forest", "feature_subsampling_fraction must lie in (0, 1]");
}

std::unique_ptr<ContinuationModel> RandomForestEstimator::fit(const std::vector<Regression_Sample>& samples) const {
    if (samples.size() < std::max<unsigned long>(min_samples_per_leaf_, 1)) {
        std::ostringstream msg;
        msg << samples.size() << " samples, at least " << min_samples_per_leaf_ << " (min samples per leaf) required";
        throw RegressionError("random forest", msg.str());
    }

    const long dim = samples[0].feature.size();
    check_dimension(dim, "random forest");

    std::vector<feature_vector> x;
    std::vector<double> y;
    x.reserve(samples.size());
    y.reserve(samples.size());
    for (const auto& s : samples) {
        if (s.feature.size() != dim)
            throw RegressionError("random forest", "inconsistent feature dimensions");
        x.push_back(s.feature);
        y.push_back(s.target);
    }

    // Les arbres sont ajustés en parallèle par dlib ; la graine fixe le résultat
    dlib::random_forest_regression_trainer<dlib::dense_feature_extractor> trainer;
    trainer.set_num_trees(num_trees_);
    trainer.set_min_samples_per_leaf(min_samples_per_leaf_);
    trainer.set_feature_subsampling_fraction(feature_subsampling_fraction_);
    trainer.set_seed(seed_);

    try {
        forest_function forest = trainer.train(x, y);
        return std::make_unique<RandomForestModel>(forest);
    } catch (const dlib::error& e) {
        throw RegressionError("random forest", e.what());
    }
}

// #############################################################################
// #                                 FABRIQUE                                   #
// #############################################################################

void validate_regression_config(const Regression_Config& config) {
    if (config.degree < 1)
        throw InvalidInput("regression config", "degree must be >= 1");
    if (config.num_trees < 1)
        throw InvalidInput("regression config", "num_trees must be >= 1");
    if (config.min_samples_per_leaf < 1)
        throw InvalidInput("regression config", "min_samples_per_leaf must be >= 1");
    if (!(config.feature_subsampling_fraction > 0.0 && config.feature_subsampling_fraction <= 1.0))
        throw InvalidInput("regression config", "feature_subsampling_fraction must lie in (0, 1]");
}

std::unique_ptr<ContinuationEstimator> make_continuation_estimator(const Regression_Config& config) {
    validate_regression_config(config);
    switch (config.method) {
    case Regression_Method::LeastSquares:
        return std::make_unique<LeastSquaresEstimator>(config.degree);
    case Regression_Method::RandomForest:
        return std::make_unique<RandomForestEstimator>(
            config.num_trees, config.min_samples_per_leaf,
            config.feature_subsampling_fraction, config.seed));
    }
    throw InvalidInput("regression config", "unknown regression method");
}
