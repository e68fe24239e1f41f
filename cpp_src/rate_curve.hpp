#ifndef RATE_CURVE_HPP
#define RATE_CURVE_HPP

#include <vector>
#include <ql/termstructures/yieldtermstructure.hpp>
#include <ql/math/interpolations/linearinterpolation.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>
#include <boost/shared_ptr.hpp>

/**
 Courbe de taux court r(t) définie par des points (temps, taux), interpolée linéairement
 et extrapolée à plat (taux du premier / dernier point hors de [times[0], times[last]]).
 Les facteurs d'actualisation intègrent la courbe : P(0,t) = exp(-int_0^t r(s) ds).
 */
class RateCurve : public QuantLib::YieldTermStructure {
public:
    RateCurve(const std::vector<double>& times, const std::vector<double>& rates,
              const QuantLib::DayCounter& day_counter = QuantLib::Actual365Fixed());

    double rate(double t) const;

    // int_{t0}^{t1} r(s) ds, pour t0 <= t1
    double integrated_rate(double t0, double t1) const;

    // Facteur d'actualisation de t1 vers t0 (t0 <= t1)
    double discount_between(double t0, double t1) const;

    QuantLib::Date maxDate() const override;

    RateCurve(const RateCurve&) = delete;
    RateCurve& operator=(const RateCurve&) = delete;

protected:
    QuantLib::DiscountFactor discountImpl(QuantLib::Time t) const override;

private:
    double primitive(double t) const;

    std::vector<double> times_;
    std::vector<double> rates_;
    QuantLib::Interpolation interpolation_;
};

boost::shared_ptr<RateCurve> make_flat_curve(double rate);

#endif
