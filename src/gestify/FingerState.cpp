#include "gestify/FingerState.hpp"
#include <cmath>

namespace gestify {

namespace {

using LI = LandmarkIndices;

constexpr float RAD_TO_DEG = 57.29577951308232f;

float distance2D(const Point2D& a, const Point2D& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

Point2D toPoint(const Keypoint& k) {
    return {k.x, k.y};
}

// {PIP, TIP} for index..pinky
constexpr std::array<std::array<int, 2>, 4> LONG_FINGERS = {{
    {LI::INDEX_PIP, LI::INDEX_TIP},
    {LI::MIDDLE_PIP, LI::MIDDLE_TIP},
    {LI::RING_PIP, LI::RING_TIP},
    {LI::PINKY_PIP, LI::PINKY_TIP},
}};

} // namespace

int ShapeDescriptor::extendedCount() const {
    int count = 0;
    for (bool e : extended) {
        if (e) ++count;
    }
    return count;
}

bool ShapeDescriptor::matches(bool thumb, bool index, bool middle, bool ring, bool pinky) const {
    return extended[0] == thumb && extended[1] == index && extended[2] == middle &&
           extended[3] == ring && extended[4] == pinky;
}

bool ShapeDescriptor::longFingersFlexed() const {
    return !extended[1] && !extended[2] && !extended[3] && !extended[4];
}

float handReferenceLength(const HandSnapshot& hand) {
    return distance2D(toPoint(hand.keypoints[LI::WRIST]), toPoint(hand.keypoints[LI::MIDDLE_MCP]));
}

ShapeDescriptor extractShape(const HandSnapshot& hand,
                             const PipelineConfig::Shape& shapeConfig,
                             float referenceHandSize) {
    const auto& kp = hand.keypoints;
    ShapeDescriptor shape;

    const Point2D wrist = toPoint(kp[LI::WRIST]);
    const Point2D middleMcp = toPoint(kp[LI::MIDDLE_MCP]);
    const float handSize = handReferenceLength(hand);
    shape.handSize = handSize;

    // Palm center: wrist plus the four finger bases
    Point2D palm;
    for (int idx : {LI::WRIST, LI::INDEX_MCP, LI::MIDDLE_MCP, LI::RING_MCP, LI::PINKY_MCP}) {
        palm.x += kp[idx].x;
        palm.y += kp[idx].y;
    }
    palm.x /= 5.0f;
    palm.y /= 5.0f;
    shape.palmCenter = palm;
    shape.indexTip = toPoint(kp[LI::INDEX_TIP]);

    // Long fingers: tip must be farther from the palm than the PIP joint,
    // by a margin relative to hand size
    const float fingerMargin = shapeConfig.fingerMargin * handSize;
    for (size_t i = 0; i < LONG_FINGERS.size(); ++i) {
        float pipDist = distance2D(toPoint(kp[LONG_FINGERS[i][0]]), palm);
        float tipDist = distance2D(toPoint(kp[LONG_FINGERS[i][1]]), palm);
        shape.extended[i + 1] = tipDist > pipDist + fingerMargin;
    }

    // Thumb: flexion is mostly sideways across the palm, so compare lateral
    // offsets from the wrist -> middle MCP axis instead of radial distance
    Point2D axis{middleMcp.x - wrist.x, middleMcp.y - wrist.y};
    float axisLen = std::sqrt(axis.x * axis.x + axis.y * axis.y);
    axis.x /= axisLen;
    axis.y /= axisLen;
    const Point2D normal{-axis.y, axis.x};

    auto lateral = [&](int idx) {
        return std::fabs((kp[idx].x - wrist.x) * normal.x + (kp[idx].y - wrist.y) * normal.y);
    };
    shape.extended[0] = lateral(LI::THUMB_TIP) - lateral(LI::THUMB_IP) > shapeConfig.thumbMargin * handSize;

    // Thumb direction for thumbs up/down
    Point2D thumbDir{kp[LI::THUMB_TIP].x - kp[LI::THUMB_MCP].x,
                     kp[LI::THUMB_TIP].y - kp[LI::THUMB_MCP].y};
    float thumbLen = std::sqrt(thumbDir.x * thumbDir.x + thumbDir.y * thumbDir.y);
    if (thumbLen > 1e-3f) {
        // Image Y grows downward
        float up = -thumbDir.y / thumbLen;
        if (up >= shapeConfig.thumbVerticalRatio) {
            shape.thumbDirection = ThumbDirection::Up;
        } else if (-up >= shapeConfig.thumbVerticalRatio) {
            shape.thumbDirection = ThumbDirection::Down;
        }
    }

    // Pinch, rescaled to the reference hand size
    float pinchRaw = distance2D(toPoint(kp[LI::THUMB_TIP]), shape.indexTip);
    shape.pinchDistance = pinchRaw / handSize * referenceHandSize;

    shape.palmAngleDeg = std::atan2(axis.x, -axis.y) * RAD_TO_DEG;

    Point2D tipDir{kp[LI::MIDDLE_TIP].x - wrist.x, kp[LI::MIDDLE_TIP].y - wrist.y};
    float tipLen = std::sqrt(tipDir.x * tipDir.x + tipDir.y * tipDir.y);
    if (tipLen > 1e-3f) {
        shape.orientation = {tipDir.x / tipLen, tipDir.y / tipLen};
    }

    return shape;
}

} // namespace gestify
