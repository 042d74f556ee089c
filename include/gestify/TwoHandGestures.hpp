#pragma once

#include "Config.hpp"
#include "GestureEvent.hpp"
#include <optional>
#include <vector>

namespace gestify {

/**
 * Zoom / rotate from the PRIMARY + SECONDARY pair.
 *
 * Zoom: separation change against a baseline. Once |change| exceeds the
 * deadband a ZoomIn/ZoomOut fires with factor = larger/smaller separation
 * and the baseline moves to the current separation.
 *
 * Rotate: angle of the primary -> secondary line against a baseline,
 * wrapped to [-180, 180]. Once |change| exceeds the threshold a RotateCW
 * or RotateCCW fires and the baseline resets to the current angle. The
 * direction is the one the user sees: with a mirrored output a clockwise
 * turn in the camera image is counter-clockwise on screen.
 */
class TwoHandGestures {
public:
    explicit TwoHandGestures(const PipelineConfig::TwoHand& config, bool mirrored = false);

    /**
     * One frame where both hands are engaged (pinched or open palm).
     * Positions are image pixels.
     */
    void update(const Point2D& primary, const Point2D& secondary, std::vector<GestureEvent>& out);

    /**
     * The pair is not engaged this frame: drop baselines so the next
     * engagement starts fresh.
     */
    void reset();

    [[nodiscard]] bool engaged() const { return baselineSeparation_.has_value(); }

private:
    PipelineConfig::TwoHand config_;
    bool mirrored_;
    std::optional<float> baselineSeparation_;
    std::optional<float> baselineAngleDeg_;
};

} // namespace gestify
