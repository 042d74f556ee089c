#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include "math/Filters.hpp"
#include <deque>

namespace gestify {

/**
 * Short per-hand history for cursor smoothing and velocity.
 *
 * Two channels are buffered per frame:
 * - pointer: index fingertip, drives cursor and drag positions
 * - palm:    palm center, drives velocity (stable across shape changes)
 *
 * Smoothed pointer = newestWeight * newest + (1 - newestWeight) * mean(older).
 * Velocity = (newest palm - oldest palm) / elapsed seconds.
 */
class TemporalSmoother {
public:
    explicit TemporalSmoother(const PipelineConfig::Smoothing& config);

    void push(const Point2D& pointer, const Point2D& palm, double timestamp);
    void reset();

    [[nodiscard]] Point2D smoothedPointer() const { return smoothed_; }

    // px per second, zero until two samples with distinct timestamps exist
    [[nodiscard]] Point2D velocity() const;

    [[nodiscard]] size_t size() const { return history_.size(); }
    [[nodiscard]] bool empty() const { return history_.empty(); }

private:
    struct Sample {
        Point2D pointer;
        Point2D palm;
        double timestamp = 0.0;
    };

    PipelineConfig::Smoothing config_;
    std::deque<Sample> history_;
    Point2D smoothed_;
    math::OneEuroFilter2D oneEuro_;

    Point2D weightedPointer() const;
};

} // namespace gestify
