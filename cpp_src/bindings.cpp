#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <boost/make_shared.hpp>
#include <random>

#include "pricing_errors.hpp"
#include "rate_curve.hpp"
#include "heston_paths.hpp"
#include "regression.hpp"
#include "lsm_pricer.hpp"
#include "european_option_pricer.hpp"

namespace py = pybind11;
using namespace py::literals;

// Helper : conversion d'une matrice dlib en liste de listes Python
std::vector<std::vector<double>> to_rows(const dlib::matrix<double>& m) {
    std::vector<std::vector<double>> rows(m.nr(), std::vector<double>(m.nc()));
    for (long i = 0; i < m.nr(); ++i)
        for (long j = 0; j < m.nc(); ++j)
            rows[i][j] = m(i, j);
    return rows;
}

Regression_Config make_regression_config(
    Regression_Method method, int degree, bool use_variance_feature,
    unsigned long num_trees, unsigned long min_samples_per_leaf,
    double feature_subsampling_fraction, const std::string& forest_seed, bool skip_failed_steps
) {
    Regression_Config config;
    config.method = method;
    config.degree = degree;
    config.use_variance_feature = use_variance_feature;
    config.num_trees = num_trees;
    config.min_samples_per_leaf = min_samples_per_leaf;
    config.feature_subsampling_fraction = feature_subsampling_fraction;
    config.seed = forest_seed;
    config.failure_policy = skip_failed_steps ? Regression_Failure_Policy::SkipStep
                                              : Regression_Failure_Policy::Propagate;
    return config;
}

// Définition du Module Python
PYBIND11_MODULE(heston_pricer, m) {
    m.doc() = "Moteur C++ pour la valorisation d'options américaines sous Heston (LSM / forêt aléatoire)";

    // --- 1. Exceptions ---
    auto& base = py::register_exception<PricingError>(m, "PricingError");
    py::register_exception<InvalidInput>(m, "InvalidInput", base.ptr());
    py::register_exception<ComputationError>(m, "ComputationError", base.ptr());
    py::register_exception<RegressionError>(m, "RegressionError", base.ptr());
    py::register_exception<InterpolationError>(m, "InterpolationError", base.ptr());

    // --- 2. Énumérations et structures de paramètres ---
    py::enum_<Option_Type>(m, "OptionType")
        .value("Call", Option_Type::Call)
        .value("Put", Option_Type::Put);

    py::enum_<Regression_Method>(m, "RegressionMethod")
        .value("LeastSquares", Regression_Method::LeastSquares)
        .value("RandomForest", Regression_Method::RandomForest);

    py::class_<Heston_Params>(m, "Heston_Params")
        .def(py::init<>())
        .def(py::init([](double kappa, double theta, double sigma, double rho) {
            return Heston_Params{kappa, theta, sigma, rho};
        }), "kappa"_a, "theta"_a, "sigma"_a, "rho"_a)
        .def_readwrite("kappa", &Heston_Params::kappa)
        .def_readwrite("theta", &Heston_Params::theta)
        .def_readwrite("sigma", &Heston_Params::sigma)
        .def_readwrite("rho", &Heston_Params::rho);

    // --- 3. Pricing Heston ---
    m.def("price_heston",
        [](Option_Type type, double spot, double strike, double T, double v0,
           const std::vector<double>& times, const std::vector<double>& rates,
           const Heston_Params& params, bool is_american, Regression_Method method,
           int num_paths, int num_steps, unsigned int seed, int degree, bool use_variance_feature,
           unsigned long num_trees, unsigned long min_samples_per_leaf, double feature_subsampling_fraction,
           const std::string& forest_seed, bool skip_failed_steps) {
            auto curve = boost::make_shared<RateCurve>(times, rates);
            Option_Spec option{type, spot, strike, T, is_american};
            Simulation_Config sim{num_paths, num_steps, seed};
            Regression_Config reg = make_regression_config(method, degree, use_variance_feature, num_trees,
                min_samples_per_leaf, feature_subsampling_fraction, forest_seed, skip_failed_steps);

            Pricing_Result res = price_heston_option_detailed(option, v0, params, curve, sim, reg);
            py::dict out;
            out["price"] = res.price;
            out["std_error"] = res.std_error;
            out["early_exercises"] = res.early_exercises;
            out["skipped_steps"] = res.skipped_steps;
            return out;
        },
        "option_type"_a, "spot"_a, "strike"_a, "time_to_expiry"_a, "initial_variance"_a,
        "times"_a, "rates"_a, "params"_a, "is_american"_a = true,
        "regression_method"_a = Regression_Method::LeastSquares,
        "num_paths"_a = 10000, "num_steps"_a = 50, "seed"_a = 42u, "degree"_a = 2,
        "use_variance_feature"_a = false, "num_trees"_a = 100ul, "min_samples_per_leaf"_a = 5ul,
        "feature_subsampling_fraction"_a = 1.0, "forest_seed"_a = "heston", "skip_failed_steps"_a = false
    );

    m.def("simulate_heston",
        [](double spot, double v0, double T, const Heston_Params& params,
           const std::vector<double>& times, const std::vector<double>& rates,
           int num_paths, int num_steps, unsigned int seed) {
            auto curve = boost::make_shared<RateCurve>(times, rates);
            std::mt19937 generator(seed);
            Heston_Paths paths = simulate_heston_paths(spot, v0, T, params, num_paths, num_steps, curve, generator);
            return py::make_tuple(to_rows(paths.spot), to_rows(paths.variance));
        },
        "spot"_a, "initial_variance"_a, "time_to_expiry"_a, "params"_a, "times"_a, "rates"_a,
        "num_paths"_a, "num_steps"_a, "seed"_a = 42u
    );

    m.def("interpolate_rate",
        [](const std::vector<double>& times, const std::vector<double>& rates, double t) {
            RateCurve curve(times, rates);
            return curve.rate(t);
        }, "times"_a, "rates"_a, "t"_a
    );

    // --- 4. Pricers de référence ---
    m.def("price_black_scholes", &price_black_scholes,
        "option_type"_a, "spot"_a, "strike"_a, "time_to_expiry"_a, "volatility"_a, "risk_free_rate"_a);

    m.def("price_binomial", &price_binomial,
        "option_type"_a, "spot"_a, "strike"_a, "time_to_expiry"_a, "volatility"_a, "risk_free_rate"_a,
        "steps"_a, "is_american"_a);

    m.def("intrinsic_value", &intrinsic_value, "option_type"_a, "spot"_a, "strike"_a);
}
