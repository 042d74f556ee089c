#include "gestify/TemporalSmoother.hpp"

namespace gestify {

TemporalSmoother::TemporalSmoother(const PipelineConfig::Smoothing& config)
    : config_(config),
      oneEuro_(config.oneEuroMinCutoff, config.oneEuroBeta) {
}

void TemporalSmoother::push(const Point2D& pointer, const Point2D& palm, double timestamp) {
    history_.push_back({pointer, palm, timestamp});
    while (history_.size() > static_cast<size_t>(config_.window)) {
        history_.pop_front();
    }

    if (config_.oneEuro) {
        Point2D filtered = pointer;
        oneEuro_.filter(filtered.x, filtered.y, timestamp);
        smoothed_ = filtered;
    } else {
        smoothed_ = weightedPointer();
    }
}

void TemporalSmoother::reset() {
    history_.clear();
    smoothed_ = {};
    oneEuro_.reset();
}

Point2D TemporalSmoother::weightedPointer() const {
    const Point2D& newest = history_.back().pointer;
    if (history_.size() < 2) {
        return newest;
    }

    Point2D older;
    size_t count = history_.size() - 1;
    for (size_t i = 0; i < count; ++i) {
        older.x += history_[i].pointer.x;
        older.y += history_[i].pointer.y;
    }
    older.x /= static_cast<float>(count);
    older.y /= static_cast<float>(count);

    const float w = config_.newestWeight;
    return {w * newest.x + (1.0f - w) * older.x,
            w * newest.y + (1.0f - w) * older.y};
}

Point2D TemporalSmoother::velocity() const {
    if (history_.size() < 2) {
        return {};
    }
    const Sample& oldest = history_.front();
    const Sample& newest = history_.back();
    double dt = newest.timestamp - oldest.timestamp;
    if (dt <= 1e-6) {
        return {};
    }
    return {static_cast<float>((newest.palm.x - oldest.palm.x) / dt),
            static_cast<float>((newest.palm.y - oldest.palm.y) / dt)};
}

} // namespace gestify
