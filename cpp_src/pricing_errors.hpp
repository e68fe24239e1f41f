#ifndef PRICING_ERRORS_HPP
#define PRICING_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Hiérarchie d'exceptions du pricer. Chaque message commence par l'étape fautive.
class PricingError : public std::runtime_error {
public:
    PricingError(const std::string& stage, const std::string& what)
        : std::runtime_error(stage + ": " + what), stage_(stage) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

// Paramètres invalides, détectés avant toute simulation
class InvalidInput : public PricingError {
public:
    using PricingError::PricingError;
};

// Échec numérique non imputable aux entrées (divergence de la simulation...)
class ComputationError : public PricingError {
public:
    using PricingError::PricingError;
};

// Échantillons insuffisants ou dégénérés pour la régression
class RegressionError : public PricingError {
public:
    RegressionError(const std::string& stage, const std::string& what,
                    std::vector<int> steps = {})
        : PricingError(stage, what), steps_(std::move(steps)) {}

    // Pas de temps (à rebours) où la régression a échoué, vide si inconnu
    const std::vector<int>& steps() const { return steps_; }

private:
    std::vector<int> steps_;
};

// Courbe mal formée détectée au moment de la lecture
class InterpolationError : public PricingError {
public:
    using PricingError::PricingError;
};

#endif
