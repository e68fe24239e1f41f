#ifndef LSM_PRICER_HPP
#define LSM_PRICER_HPP

#include <vector>
#include <dlib/matrix.h>
#include <boost/shared_ptr.hpp>

#include "option.hpp"
#include "heston_paths.hpp"
#include "regression.hpp"

class RateCurve;

struct Pricing_Result {
    double price = 0.0;
    double std_error = 0.0;
    long early_exercises = 0;           // trajectoires exercées avant l'échéance
    std::vector<int> skipped_steps;     // pas ignorés (politique SkipStep)
    dlib::matrix<double> cash_flows;    // registre (trajectoire, pas), au plus un flux non nul par ligne
    std::vector<int> exercise_steps;    // pas où le flux de chaque trajectoire est réalisé
};

// FONCTIONS DE L'ALGORITHME LSM

/**
 Induction à rebours de Longstaff-Schwartz sur un ensemble de trajectoires déjà simulées.
 À chaque pas t = N-1..1, seules les trajectoires dans la monnaie entrent dans la régression ;
 l'exercice a lieu si valeur immédiate >= valeur de continuation estimée.
 Les flux sont actualisés par l'intégrale de la courbe de taux entre les pas concernés.
 Si option.is_american est faux, seul le flux à l'échéance est actualisé.
 */
Pricing_Result run_lsm_backward_induction(
    const Heston_Paths& paths, const Option_Spec& option,
    const boost::shared_ptr<RateCurve>& rate_curve,
    const ContinuationEstimator& estimator, const Regression_Config& config
);

// FONCTIONS DE PRICING

void validate_option_spec(const Option_Spec& option);

/**
 Point d'entrée : valide toutes les entrées, simule les trajectoires de Heston avec la graine
 de sim_config, puis applique l'induction à rebours avec l'estimateur choisi par reg_config.
 */
Pricing_Result price_heston_option_detailed(
    const Option_Spec& option, double initial_variance, const Heston_Params& params,
    const boost::shared_ptr<RateCurve>& rate_curve,
    const Simulation_Config& sim_config, const Regression_Config& reg_config
);

double price_heston_option(
    const Option_Spec& option, double initial_variance, const Heston_Params& params,
    const boost::shared_ptr<RateCurve>& rate_curve,
    const Simulation_Config& sim_config, const Regression_Config& reg_config
);

#endif
