#ifndef REGRESSION_HPP
#define REGRESSION_HPP

#include <memory>
#include <string>
#include <vector>
#include <dlib/matrix.h>
#include <dlib/random_forest.h>

typedef dlib::matrix<double, 0, 1> feature_vector;

// Couple (état, flux réalisé actualisé) d'une trajectoire dans la monnaie
struct Regression_Sample {
    feature_vector feature;
    double target;
};

enum class Regression_Method { LeastSquares, RandomForest };

// Conduite à tenir quand l'estimation échoue à un pas de l'induction à rebours
enum class Regression_Failure_Policy { Propagate, SkipStep };

struct Regression_Config {
    Regression_Method method = Regression_Method::LeastSquares;
    int degree = 2;
    bool use_variance_feature = false;
    // Forêt aléatoire
    unsigned long num_trees = 100;
    unsigned long min_samples_per_leaf = 5;
    double feature_subsampling_fraction = 1.0;
    std::string seed = "heston";
    Regression_Failure_Policy failure_policy = Regression_Failure_Policy::Propagate;
};

// Fonction ajustée : état -> valeur de continuation estimée
class ContinuationModel {
public:
    virtual ~ContinuationModel() {}
    virtual double predict(const feature_vector& feature) const = 0;
};

class ContinuationEstimator {
public:
    virtual ~ContinuationEstimator() {}

    // Lève RegressionError si les échantillons ne permettent pas l'ajustement
    virtual std::unique_ptr<ContinuationModel> fit(const std::vector<Regression_Sample>& samples) const = 0;

    virtual std::string name() const = 0;
};

// --- Moindres carrés sur base polynomiale ---

// Colonnes : tous les monômes de degré total <= degree (1, S, S^2 en dimension 1)
dlib::matrix<double> create_design_matrix(const std::vector<feature_vector>& features, int degree);
dlib::matrix<double, 1, 0> basis_functions(const feature_vector& feature, int degree);

class LeastSquaresModel : public ContinuationModel {
public:
    LeastSquaresModel(const dlib::matrix<double, 0, 1>& coefficients, const feature_vector& scales, int degree)
        : coefficients_(coefficients), scales_(scales), degree_(degree) {}

    double predict(const feature_vector& feature) const override;

private:
    dlib::matrix<double, 0, 1> coefficients_;
    feature_vector scales_;
    int degree_;
};

class LeastSquaresEstimator : public ContinuationEstimator {
public:
    explicit LeastSquaresEstimator(int degree = 2);

    std::unique_ptr<ContinuationModel> fit(const std::vector<Regression_Sample>& samples) const override;
    std::string name() const override { return "least squares"; }

private:
    int degree_;
};

// --- Forêt d'arbres de régression (dlib) ---

typedef dlib::random_forest_regression_function<dlib::dense_feature_extractor> forest_function;

class RandomForestModel : public ContinuationModel {
public:
    explicit RandomForestModel(const forest_function& forest) : forest_(forest) {}

    double predict(const feature_vector& feature) const override { return forest_(feature); }

private:
    forest_function forest_;
};

/**
 Forêt de dlib : chaque arbre est ajusté sur un rééchantillonnage bootstrap, seuils de coupure
 tirés au hasard sur un sous-ensemble des variables. Le trainer de dlib n'a pas de profondeur
 maximale : les arbres croissent jusqu'à min_samples_per_leaf, qui borne donc la profondeur.
 */
class RandomForestEstimator : public ContinuationEstimator {
public:
    RandomForestEstimator(unsigned long num_trees, unsigned long min_samples_per_leaf,
                          double feature_subsampling_fraction, const std::string& seed);

    std::unique_ptr<ContinuationModel> fit(const std::vector<Regression_Sample>& samples) const override;
    std::string name() const override { return "random forest"; }

private:
    unsigned long num_trees_;
    unsigned long min_samples_per_leaf_;
    double feature_subsampling_fraction_;
    std::string seed_;
};

void validate_regression_config(const Regression_Config& config);

std::unique_ptr<ContinuationEstimator> make_continuation_estimator(const Regression_Config& config);

#endif
