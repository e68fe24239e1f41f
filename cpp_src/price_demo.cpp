#include <iomanip>
#include <iostream>
#include <boost/make_shared.hpp>

#include "pricing_errors.hpp"
#include "rate_curve.hpp"
#include "lsm_pricer.hpp"
#include "european_option_pricer.hpp"

// Put américain de référence sous Heston, courbe plate à 5 %
int main() {
    auto curve = boost::make_shared<RateCurve>(std::vector<double>{0.0, 1.0}, std::vector<double>{0.05, 0.05});

    Option_Spec option{Option_Type::Put, 100.0, 100.0, 1.0, true};
    Heston_Params params{2.0, 0.04, 0.1, -0.7};
    Simulation_Config sim{10000, 50, 42};
    Regression_Config reg;

    try {
        Pricing_Result american = price_heston_option_detailed(option, 0.04, params, curve, sim, reg);

        option.is_american = false;
        Pricing_Result european = price_heston_option_detailed(option, 0.04, params, curve, sim, reg);

        reg.method = Regression_Method::RandomForest;
        option.is_american = true;
        Pricing_Result forest = price_heston_option_detailed(option, 0.04, params, curve, sim, reg);

        std::cout << std::fixed << std::setprecision(4)
                  << "Heston American put (least squares): " << american.price
                  << " +/- " << american.std_error << " (" << american.early_exercises << " early exercises)\n"
                  << "Heston American put (random forest): " << forest.price << " +/- " << forest.std_error << "\n"
                  << "Heston European put:                 " << european.price << " +/- " << european.std_error << "\n"
                  << "Black-Scholes European put (20%):    "
                  << price_black_scholes(Option_Type::Put, 100.0, 100.0, 1.0, 0.2, 0.05) << std::endl;
    } catch (const PricingError& e) {
        std::cerr << "pricing failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
