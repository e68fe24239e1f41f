#include "utils.hpp"
#include <ql/math/distributions/normaldistribution.hpp>
#include <algorithm>
#include <cmath>

namespace Utils {
    double normal_cdf(double x) {
        QuantLib::CumulativeNormalDistribution cnd;
        return cnd(x);
    }

    double payoff(Option_Type type, double spot, double strike) {
        return type == Option_Type::Call ? std::max(spot - strike, 0.0) : std::max(strike - spot, 0.0);
    }

    void mean_and_std_error(const dlib::matrix<double, 0, 1>& values, double& mean, double& std_error) {
        const long n = values.size();
        mean = 0.0;
        std_error = 0.0;
        if (n == 0) return;
        mean = dlib::mean(values);
        if (n < 2) return;
        double var = dlib::sum(dlib::squared(values - mean)) / (n - 1.0);
        std_error = std::sqrt(var / n);
    }
}
