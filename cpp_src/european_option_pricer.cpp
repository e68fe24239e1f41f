#include "european_option_pricer.hpp"
#include "pricing_errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

double intrinsic_value(Option_Type type, double spot, double strike) {
    return Utils::payoff(type, spot, strike);
}

double price_black_scholes(
    Option_Type type, double spot, double strike, double T,
    double volatility, double risk_free_rate
) {
    if (!(T > 0.0))
        throw InvalidInput("black-scholes", "time_to_expiry must be positive");
    if (!(spot > 0.0) || !(strike > 0.0))
        throw InvalidInput("black-scholes", "spot and strike must be positive");
    if (!(volatility >= 0.0))
        throw InvalidInput("black-scholes", "volatility must be >= 0");

    double df = std::exp(-risk_free_rate * T);
    double sigma_sqrt_T = volatility * std::sqrt(T);

    // Volatilité nulle : le sous-jacent croît au taux sans risque
    if (sigma_sqrt_T < 1e-12) {
        return Utils::payoff(type, spot, strike * df);
    }

    double d1 = (std::log(spot / strike) + (risk_free_rate + 0.5 * volatility * volatility) * T) / sigma_sqrt_T;
    double d2 = d1 - sigma_sqrt_T;

    if (type == Option_Type::Call) {
        return spot * Utils::normal_cdf(d1) - strike * df * Utils::normal_cdf(d2);
    } else {
        return strike * df * Utils::normal_cdf(-d2) - spot * Utils::normal_cdf(-d1);
    }
}

double price_binomial(
    Option_Type type, double spot, double strike, double T,
    double volatility, double risk_free_rate, int steps, bool is_american
) {
    if (steps < 1)
        throw InvalidInput("binomial", "number of steps must be >= 1");
    if (!(T > 0.0))
        throw InvalidInput("binomial", "time_to_expiry must be positive");
    if (!(volatility > 0.0))
        throw InvalidInput("binomial", "volatility must be positive");

    double dt = T / steps;
    double up = std::exp(volatility * std::sqrt(dt));
    double down = 1.0 / up;
    double discount = std::exp(-risk_free_rate * dt);
    double p = (1.0 / discount - down) / (up - down);
    if (!(p > 0.0 && p < 1.0))
        throw ComputationError("binomial", "risk-neutral probability outside (0, 1), increase steps");

    // Valeurs à l'échéance, noeud i = i baisses
    std::vector<double> values(steps + 1);
    for (int i = 0; i <= steps; ++i) {
        double s = spot * std::pow(up, steps - i) * std::pow(down, i);
        values[i] = Utils::payoff(type, s, strike);
    }

    for (int step = steps - 1; step >= 0; --step) {
        for (int i = 0; i <= step; ++i) {
            values[i] = discount * (p * values[i] + (1.0 - p) * values[i + 1]);
            if (is_american) {
                double s = spot * std::pow(up, step - i) * std::pow(down, i);
                values[i] = std::max(values[i], Utils::payoff(type, s, strike));
            }
        }
    }
    return values[0];
}
