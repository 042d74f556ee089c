#include "gestify/TwoHandGestures.hpp"
#include "gestify/Logger.hpp"
#include <cmath>

namespace gestify {

namespace {

constexpr float RAD_TO_DEG = 57.29577951308232f;

float wrapDegrees(float angle) {
    while (angle > 180.0f) angle -= 360.0f;
    while (angle < -180.0f) angle += 360.0f;
    return angle;
}

} // namespace

TwoHandGestures::TwoHandGestures(const PipelineConfig::TwoHand& config, bool mirrored)
    : config_(config), mirrored_(mirrored) {
}

void TwoHandGestures::reset() {
    if (baselineSeparation_) {
        Logger::debug("TwoHandGestures: pair disengaged");
    }
    baselineSeparation_.reset();
    baselineAngleDeg_.reset();
}

void TwoHandGestures::update(const Point2D& primary, const Point2D& secondary,
                             std::vector<GestureEvent>& out) {
    float dx = secondary.x - primary.x;
    float dy = secondary.y - primary.y;
    float separation = std::sqrt(dx * dx + dy * dy);
    float angle = std::atan2(dy, dx) * RAD_TO_DEG;

    if (!baselineSeparation_) {
        // First engaged frame only sets the baselines
        baselineSeparation_ = separation;
        baselineAngleDeg_ = angle;
        Logger::debug("TwoHandGestures: pair engaged, separation=", separation, " angle=", angle);
        return;
    }

    float change = separation - *baselineSeparation_;
    if (std::fabs(change) > config_.zoomDeadband && *baselineSeparation_ > 1e-3f && separation > 1e-3f) {
        if (change > 0.0f) {
            out.push_back(GestureEvent::scalar(GestureKind::ZoomIn, separation / *baselineSeparation_));
        } else {
            out.push_back(GestureEvent::scalar(GestureKind::ZoomOut, *baselineSeparation_ / separation));
        }
        baselineSeparation_ = separation;
    }

    float turn = wrapDegrees(angle - *baselineAngleDeg_);
    if (std::fabs(turn) > config_.rotateThresholdDeg) {
        // Image Y grows downward, so a growing angle is clockwise in the image
        bool clockwise = (turn > 0.0f) != mirrored_;
        out.push_back(GestureEvent::scalar(clockwise ? GestureKind::RotateCW : GestureKind::RotateCCW,
                                           std::fabs(turn)));
        baselineAngleDeg_ = angle;
    }
}

} // namespace gestify
