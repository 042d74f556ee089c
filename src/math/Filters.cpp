#include "math/Filters.hpp"

namespace math {

OneEuroFilter::OneEuroFilter(double minCutoff, double beta, double dCutoff)
    : _minCutoff(minCutoff), _beta(beta), _dCutoff(dCutoff) {
    reset();
}

double OneEuroFilter::filter(double value, double timestamp) {
    if (!_x.initialized) {
        _lastTimestamp = timestamp;
        _dx.filter(0.0, 1.0);
        return _x.filter(value, 1.0);
    }

    double dt = timestamp - _lastTimestamp;
    if (dt <= 0.0) {
        // Same or older timestamp: keep the estimate, don't divide by zero
        return _x.last;
    }
    _lastTimestamp = timestamp;

    // Filtered derivative drives the cutoff of the value filter
    double dx = (value - _x.last) / dt;
    double edx = _dx.filter(dx, alpha(_dCutoff, dt));
    double cutoff = _minCutoff + _beta * std::abs(edx);

    return _x.filter(value, alpha(cutoff, dt));
}

void OneEuroFilter::reset() {
    _x = LowPassFilter();
    _dx = LowPassFilter();
    _lastTimestamp = 0.0;
}

} // namespace math
