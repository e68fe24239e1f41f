#ifndef HESTON_PATHS_HPP
#define HESTON_PATHS_HPP

#include <random>
#include <dlib/matrix.h>
#include <boost/shared_ptr.hpp>

class RateCurve;

struct Heston_Params {
    double kappa;   // vitesse de retour à la moyenne
    double theta;   // variance de long terme
    double sigma;   // volatilité de la variance
    double rho;     // corrélation spot / variance
};

struct Simulation_Config {
    int num_paths;
    int num_steps;
    unsigned int seed = 42;
};

// Ensemble de trajectoires : ligne = trajectoire, colonne = pas de temps (0..num_steps)
struct Heston_Paths {
    dlib::matrix<double> spot;
    dlib::matrix<double> variance;
    double dt = 0.0;

    long num_paths() const { return spot.nr(); }
    long num_steps() const { return spot.nc() - 1; }
};

// Lève InvalidInput si les paramètres de simulation sont hors domaine
void validate_heston_inputs(
    double spot, double initial_variance, double T,
    const Heston_Params& params, int num_paths, int num_steps,
    const boost::shared_ptr<RateCurve>& rate_curve
);

/**
 Simule conjointement (S, V) sous Heston par un schéma d'Euler à troncature complète :
   V_{t+dt} = max(V_t + kappa (theta - V_t) dt + sigma sqrt(V_t^+) sqrt(dt) dW_V, 0)
   S_{t+dt} = S_t exp((r(t) - V_t^+ / 2) dt + sqrt(V_t^+) sqrt(dt) dW_S)
 avec dW_S = z1, dW_V = rho z1 + sqrt(1 - rho^2) z2. Le générateur est fourni par l'appelant.
 */
Heston_Paths simulate_heston_paths(
    double spot, double initial_variance, double T,
    const Heston_Params& params, int num_paths, int num_steps,
    const boost::shared_ptr<RateCurve>& rate_curve,
    std::mt19937& generator
);

#endif
