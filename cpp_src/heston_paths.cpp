#include "heston_paths.hpp"
#include "rate_curve.hpp"
#include "pricing_errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

    void require(bool condition, const std::string& what) {
        if (!condition) throw InvalidInput("heston simulation", what);
    }

}

void validate_heston_inputs(
    double spot, double initial_variance, double T,
    const Heston_Params& params, int num_paths, int num_steps,
    const boost::shared_ptr<RateCurve>& rate_curve
) {
    require(num_paths >= 1, "num_paths must be >= 1");
    require(num_steps >= 1, "num_steps must be >= 1");
    require(std::isfinite(spot) && spot > 0.0, "spot must be positive");
    require(std::isfinite(T) && T > 0.0, "time_to_expiry must be positive");
    require(std::isfinite(initial_variance) && initial_variance >= 0.0, "initial_variance must be >= 0");
    require(std::isfinite(params.kappa) && params.kappa > 0.0, "kappa must be > 0");
    require(std::isfinite(params.theta) && params.theta >= 0.0, "theta must be >= 0");
    require(std::isfinite(params.sigma) && params.sigma >= 0.0, "sigma must be >= 0");
    require(std::isfinite(params.rho) && params.rho >= -1.0 && params.rho <= 1.0, "rho must lie in [-1, 1]");
    require(rate_curve.get() != nullptr, "rate curve is missing");
}

Heston_Paths simulate_heston_paths(
    double spot, double initial_variance, double T,
    const Heston_Params& params, int num_paths, int num_steps,
    const boost::shared_ptr<RateCurve>& rate_curve,
    std::mt19937& generator
) {
    validate_heston_inputs(spot, initial_variance, T, params, num_paths, num_steps, rate_curve);

    double dt = T / num_steps;
    double sqrt_dt = std::sqrt(dt);
    double rho_bar = std::sqrt(1.0 - params.rho * params.rho);

    std::normal_distribution<double> distribution(0.0, 1.0);

    Heston_Paths paths;
    paths.dt = dt;
    paths.spot.set_size(num_paths, num_steps + 1);
    paths.variance.set_size(num_paths, num_steps + 1);
    dlib::set_colm(paths.spot, 0) = spot;
    dlib::set_colm(paths.variance, 0) = initial_variance;

    for (int j = 0; j < num_steps; ++j) {
        double t = j * dt;
        double r_t = rate_curve->rate(t);

        for (int i = 0; i < num_paths; ++i) {
            double z1 = distribution(generator);
            double z2 = distribution(generator);

            // Factorisation de Cholesky de la matrice de corrélation 2x2
            double dW_S = z1;
            double dW_V = params.rho * z1 + rho_bar * z2;

            double prev_v = std::max(paths.variance(i, j), 0.0);
            double prev_s = paths.spot(i, j);
            double vol = std::sqrt(prev_v);

            double next_v = paths.variance(i, j) + params.kappa * (params.theta - paths.variance(i, j)) * dt
                            + params.sigma * vol * sqrt_dt * dW_V;
            double next_s = prev_s * std::exp((r_t - 0.5 * prev_v) * dt + vol * sqrt_dt * dW_S);

            if (!std::isfinite(next_v) || !std::isfinite(next_s)) {
                std::ostringstream msg;
                msg << "non-finite state on path " << i << " at step " << j + 1;
                throw ComputationError("heston simulation", msg.str());
            }

            paths.variance(i, j + 1) = std::max(next_v, 0.0);
            paths.spot(i, j + 1) = next_s;
        }
    }
    return paths;
}
