#include "rate_curve.hpp"
#include "pricing_errors.hpp"

#include <ql/settings.hpp>
#include <ql/time/calendars/nullcalendar.hpp>
#include <boost/make_shared.hpp>
#include <cmath>
#include <sstream>

namespace {

    void validate_curve(const std::vector<double>& times, const std::vector<double>& rates) {
        if (times.empty())
            throw InvalidInput("rate curve", "at least one (time, rate) point is required");
        if (times.size() != rates.size()) {
            std::ostringstream msg;
            msg << "times and rates lengths differ (" << times.size() << " vs " << rates.size() << ")";
            throw InvalidInput("rate curve", msg.str());
        }
        for (size_t i = 0; i < times.size(); ++i) {
            if (!std::isfinite(times[i]) || !std::isfinite(rates[i])) {
                std::ostringstream msg;
                msg << "non-finite point at index " << i;
                throw InvalidInput("rate curve", msg.str());
            }
            if (i > 0 && times[i] <= times[i - 1]) {
                std::ostringstream msg;
                msg << "times must be strictly increasing (index " << i << ")";
                throw InvalidInput("rate curve", msg.str());
            }
        }
    }

}

RateCurve::RateCurve(const std::vector<double>& times, const std::vector<double>& rates,
                     const QuantLib::DayCounter& day_counter)
    : QuantLib::YieldTermStructure(QuantLib::Settings::instance().evaluationDate(),
                                   QuantLib::NullCalendar(), day_counter),
      times_(times), rates_(rates) {
    validate_curve(times_, rates_);
    // LinearInterpolation exige au moins deux points ; une courbe à un point est plate
    if (times_.size() > 1) {
        interpolation_ = QuantLib::LinearInterpolation(times_.begin(), times_.end(), rates_.begin());
    }
}

double RateCurve::rate(double t) const {
    if (std::isnan(t))
        throw InterpolationError("rate curve", "lookup at NaN time");

    double r;
    if (t <= times_.front()) {
        r = rates_.front();
    } else if (t >= times_.back()) {
        r = rates_.back();
    } else {
        r = interpolation_(t);
    }

    if (!std::isfinite(r)) {
        std::ostringstream msg;
        msg << "non-finite rate interpolated at t=" << t;
        throw InterpolationError("rate curve", msg.str());
    }
    return r;
}

// Primitive de r, ancrée en times[0]
double RateCurve::primitive(double t) const {
    if (std::isnan(t))
        throw InterpolationError("rate curve", "integration bound is NaN");

    const double t_first = times_.front();
    const double t_last = times_.back();
    if (t <= t_first)
        return rates_.front() * (t - t_first);
    if (t >= t_last) {
        double inner = (times_.size() > 1) ? interpolation_.primitive(t_last) : 0.0;
        return inner + rates_.back() * (t - t_last);
    }
    return interpolation_.primitive(t);
}

double RateCurve::integrated_rate(double t0, double t1) const {
    return primitive(t1) - primitive(t0);
}

double RateCurve::discount_between(double t0, double t1) const {
    return std::exp(-integrated_rate(t0, t1));
}

QuantLib::Date RateCurve::maxDate() const {
    return QuantLib::Date::maxDate();
}

QuantLib::DiscountFactor RateCurve::discountImpl(QuantLib::Time t) const {
    return std::exp(-integrated_rate(0.0, t));
}

boost::shared_ptr<RateCurve> make_flat_curve(double rate) {
    return boost::make_shared<RateCurve>(std::vector<double>{0.0}, std::vector<double>{rate});
}
