#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include <array>

namespace gestify {

enum class ThumbDirection {
    Sideways = 0,
    Up = 1,
    Down = 2
};

/**
 * Per-frame shape of one hand, derived from its 21 keypoints.
 */
struct ShapeDescriptor {
    // [thumb, index, middle, ring, pinky]
    std::array<bool, FINGER_COUNT> extended{};

    // Thumb tip to index tip, in px-equivalent units at the reference hand size
    float pinchDistance = 0.0f;

    // Signed angle (degrees) of wrist -> middle MCP against image "up";
    // positive = rotated clockwise on screen
    float palmAngleDeg = 0.0f;

    // Unit vector wrist -> middle fingertip
    Point2D orientation;

    ThumbDirection thumbDirection = ThumbDirection::Sideways;

    float handSize = 0.0f;      // wrist to middle MCP, px
    Point2D palmCenter;         // mean of wrist and the four MCPs
    Point2D indexTip;

    [[nodiscard]] bool isExtended(Finger finger) const {
        return extended[static_cast<size_t>(finger)];
    }

    [[nodiscard]] int extendedCount() const;

    // Exact finger pattern match, e.g. matches(false, true, false, false, false)
    [[nodiscard]] bool matches(bool thumb, bool index, bool middle, bool ring, bool pinky) const;

    // True when index..pinky are all flexed (thumb ignored)
    [[nodiscard]] bool longFingersFlexed() const;
};

/**
 * Reference length used to normalise the hand: wrist to middle MCP.
 * Caller guarantees HAND_LANDMARK_COUNT keypoints.
 */
[[nodiscard]] float handReferenceLength(const HandSnapshot& hand);

/**
 * Convert one hand into a ShapeDescriptor. Caller guarantees
 * HAND_LANDMARK_COUNT keypoints and a non-degenerate hand.
 */
[[nodiscard]] ShapeDescriptor extractShape(const HandSnapshot& hand,
                                           const PipelineConfig::Shape& shapeConfig,
                                           float referenceHandSize);

} // namespace gestify
