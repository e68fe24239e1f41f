#ifndef EUROPEAN_OPTION_PRICER_HPP
#define EUROPEAN_OPTION_PRICER_HPP

#include "option.hpp"

// Déclarations des pricers de référence (taux et volatilité constants)

// Valeur intrinsèque max(S-K,0) / max(K-S,0)
double intrinsic_value(Option_Type type, double spot, double strike);

// Formule fermée de Black-Scholes pour une option européenne
double price_black_scholes(
    Option_Type type, double spot, double strike, double T,
    double volatility, double risk_free_rate
);

// Arbre binomial de Cox-Ross-Rubinstein, européen ou américain
double price_binomial(
    Option_Type type, double spot, double strike, double T,
    double volatility, double risk_free_rate, int steps, bool is_american
);

#endif
