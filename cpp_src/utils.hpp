#ifndef UTILS_HPP
#define UTILS_HPP

#include <vector>
#include <dlib/matrix.h>
#include "option.hpp"

namespace Utils {
    double normal_cdf(double x);

    // max(S-K,0) pour un call, max(K-S,0) pour un put
    double payoff(Option_Type type, double spot, double strike);

    // Moyenne et erreur standard (écart-type / sqrt(n)) d'un vecteur colonne
    void mean_and_std_error(const dlib::matrix<double, 0, 1>& values, double& mean, double& std_error);

}

#endif
