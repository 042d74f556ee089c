#pragma once

#include <cmath>

namespace math {

/**
 * One-Euro filter (Casiez et al.): adaptive low-pass whose cutoff rises
 * with signal speed. Low jitter at rest, low lag while moving.
 */
class OneEuroFilter {
public:
    explicit OneEuroFilter(double minCutoff = 1.0, double beta = 0.007, double dCutoff = 1.0);

    /**
     * @param value raw sample
     * @param timestamp seconds; a non-increasing timestamp returns the current estimate
     */
    double filter(double value, double timestamp);
    void reset();

    [[nodiscard]] bool initialized() const { return _x.initialized; }

private:
    struct LowPassFilter {
        double last = 0.0;
        bool initialized = false;

        double filter(double value, double alpha) {
            if (!initialized) {
                last = value;
                initialized = true;
                return value;
            }
            last = alpha * value + (1.0 - alpha) * last;
            return last;
        }
    };

    static double alpha(double cutoff, double dt) {
        double tau = 1.0 / (2.0 * M_PI * cutoff);
        return 1.0 / (1.0 + tau / dt);
    }

    double _minCutoff;
    double _beta;
    double _dCutoff;
    LowPassFilter _x;
    LowPassFilter _dx;
    double _lastTimestamp = 0.0;
};

// Independent One-Euro filters on x and y
class OneEuroFilter2D {
public:
    explicit OneEuroFilter2D(double minCutoff = 1.0, double beta = 0.007)
        : _fx(minCutoff, beta), _fy(minCutoff, beta) {}

    void filter(float& x, float& y, double timestamp) {
        x = static_cast<float>(_fx.filter(x, timestamp));
        y = static_cast<float>(_fy.filter(y, timestamp));
    }

    void reset() {
        _fx.reset();
        _fy.reset();
    }

private:
    OneEuroFilter _fx;
    OneEuroFilter _fy;
};

} // namespace math
