#include "lsm_pricer.hpp"
#include "rate_curve.hpp"
#include "pricing_errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>

namespace {

    feature_vector make_feature(const Heston_Paths& paths, long p, long t, bool use_variance) {
        feature_vector f(use_variance ? 2 : 1);
        f(0) = paths.spot(p, t);
        if (use_variance) f(1) = paths.variance(p, t);
        return f;
    }

    std::string describe_steps(const std::vector<int>& steps) {
        std::ostringstream out;
        for (size_t i = 0; i < steps.size(); ++i) {
            if (i > 0) out << ", ";
            out << steps[i];
        }
        return out.str();
    }

}

// #############################################################################
// #                         INDUCTION À REBOURS (LSM)                          #
// #############################################################################

Pricing_Result run_lsm_backward_induction(
    const Heston_Paths& paths, const Option_Spec& option,
    const boost::shared_ptr<RateCurve>& rate_curve,
    const ContinuationEstimator& estimator, const Regression_Config& config
) {
    const long num_paths = paths.num_paths();
    const long num_steps = paths.num_steps();
    const double dt = paths.dt;

    if (num_paths < 1 || num_steps < 1)
        throw InvalidInput("exercise engine", "empty path ensemble");
    if (rate_curve.get() == nullptr)
        throw InvalidInput("exercise engine", "rate curve is missing");

    Pricing_Result result;
    result.cash_flows.set_size(num_paths, num_steps + 1);
    result.cash_flows = 0.0;
    result.exercise_steps.assign(num_paths, static_cast<int>(num_steps));

    auto& cash_flows = result.cash_flows;
    auto& tau = result.exercise_steps;

    // Payoff à l'échéance
    for (long p = 0; p < num_paths; ++p) {
        cash_flows(p, num_steps) = Utils::payoff(option.type, paths.spot(p, num_steps), option.strike);
    }

    std::vector<int> failed_steps;
    std::string first_failure;

    std::vector<double> step_discount(num_steps + 1, 1.0);
    for (long t = option.is_american ? num_steps - 1 : 0; t >= 1; --t) {
        const double time = t * dt;

        // Actualisation de chaque pas futur k vers t, par intégration de la courbe
        for (long k = t + 1; k <= num_steps; ++k) {
            step_discount[k] = rate_curve->discount_between(time, k * dt);
        }

        // Filtre de moneyness : seules les trajectoires dans la monnaie entrent dans la régression
        std::vector<long> itm_paths;
        std::vector<double> exercise_values;
        std::vector<Regression_Sample> samples;
        for (long p = 0; p < num_paths; ++p) {
            double h = Utils::payoff(option.type, paths.spot(p, t), option.strike);
            if (h > 0.0) {
                itm_paths.push_back(p);
                exercise_values.push_back(h);
                double discounted_future_cf = cash_flows(p, tau[p]) * step_discount[tau[p]];
                samples.push_back({make_feature(paths, p, t, config.use_variance_feature), discounted_future_cf});
            }
        }

        // Aucune trajectoire dans la monnaie : aucun exercice possible à ce pas
        if (itm_paths.empty()) continue;

        std::vector<double> continuation(itm_paths.size());
        try {
            std::unique_ptr<ContinuationModel> model = estimator.fit(samples);
            for (size_t i = 0; i < itm_paths.size(); ++i) {
                continuation[i] = model->predict(samples[i].feature);
                if (!std::isfinite(continuation[i]))
                    throw RegressionError(estimator.name(), "non-finite continuation estimate");
            }
        } catch (const RegressionError& e) {
            if (config.failure_policy == Regression_Failure_Policy::SkipStep) {
                std::cerr << "[lsm] step " << t << " skipped, no exercise considered: " << e.what() << std::endl;
                result.skipped_steps.push_back(static_cast<int>(t));
            } else {
                if (failed_steps.empty()) first_failure = e.what();
                failed_steps.push_back(static_cast<int>(t));
            }
            continue;
        }

        // Décision d'exercice ; l'exercice l'emporte en cas d'égalité
        for (size_t i = 0; i < itm_paths.size(); ++i) {
            long p = itm_paths[i];
            if (exercise_values[i] >= continuation[i]) {
                cash_flows(p, tau[p]) = 0.0;
                cash_flows(p, t) = exercise_values[i];
                tau[p] = static_cast<int>(t);
            }
        }
    }

    if (!failed_steps.empty()) {
        std::ostringstream msg;
        msg << "continuation estimate failed at step(s) " << describe_steps(failed_steps)
            << " (first: " << first_failure << ")";
        throw RegressionError("exercise engine", msg.str(), failed_steps);
    }

    // Actualisation de chaque flux réalisé vers t = 0, puis moyenne sur les trajectoires
    std::vector<double> discount_to_zero(num_steps + 1);
    for (long k = 0; k <= num_steps; ++k) {
        discount_to_zero[k] = rate_curve->discount(k * dt);
    }

    dlib::matrix<double, 0, 1> discounted(num_paths);
    for (long p = 0; p < num_paths; ++p) {
        discounted(p) = cash_flows(p, tau[p]) * discount_to_zero[tau[p]];
        if (tau[p] < num_steps) ++result.early_exercises;
    }

    Utils::mean_and_std_error(discounted, result.price, result.std_error);
    if (!std::isfinite(result.price))
        throw ComputationError("exercise engine", "non-finite price");

    return result;
}

// #############################################################################
// #                           POINT D'ENTRÉE DU PRICING                        #
// #############################################################################

void validate_option_spec(const Option_Spec& option) {
    if (!(std::isfinite(option.spot) && option.spot > 0.0))
        throw InvalidInput("option", "spot must be positive");
    if (!(std::isfinite(option.strike) && option.strike > 0.0))
        throw InvalidInput("option", "strike must be positive");
    if (!(std::isfinite(option.time_to_expiry) && option.time_to_expiry > 0.0))
        throw InvalidInput("option", "time_to_expiry must be positive");
}

Pricing_Result price_heston_option_detailed(
    const Option_Spec& option, double initial_variance, const Heston_Params& params,
    const boost::shared_ptr<RateCurve>& rate_curve,
    const Simulation_Config& sim_config, const Regression_Config& reg_config
) {
    // Toutes les validations précèdent la simulation
    validate_option_spec(option);
    validate_heston_inputs(option.spot, initial_variance, option.time_to_expiry, params,
                           sim_config.num_paths, sim_config.num_steps, rate_curve);
    std::unique_ptr<ContinuationEstimator> estimator = make_continuation_estimator(reg_config);

    std::mt19937 generator(sim_config.seed);
    Heston_Paths paths = simulate_heston_paths(
        option.spot, initial_variance, option.time_to_expiry, params,
        sim_config.num_paths, sim_config.num_steps, rate_curve, generator);

    return run_lsm_backward_induction(paths, option, rate_curve, *estimator, reg_config);
}

double price_heston_option(
    const Option_Spec& option, double initial_variance, const Heston_Params& params,
    const boost::shared_ptr<RateCurve>& rate_curve,
    const Simulation_Config& sim_config, const Regression_Config& reg_config
) {
    return price_heston_option_detailed(option, initial_variance, params, rate_curve, sim_config, reg_config).price;
}
