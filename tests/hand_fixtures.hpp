#pragma once

#include "gestify/Config.hpp"
#include "gestify/FingerState.hpp"
#include "gestify/Types.hpp"

#include <array>
#include <cmath>
#include <utility>
#include <vector>

/*
 * Synthetic hand geometry for tests.
 *
 * An upright right hand in image pixels relative to the wrist (y grows
 * downward). Wrist to middle MCP is ~65.2 px. Each long finger is either
 * straight up from its MCP or curled back toward the palm; the thumb is
 * either spread sideways or tucked across the palm.
 */
namespace fixtures {

using gestify::HandSnapshot;
using gestify::Keypoint;
using Pattern = std::array<bool, gestify::FINGER_COUNT>; // thumb, index, middle, ring, pinky

constexpr Pattern POINT = {false, true, false, false, false};
constexpr Pattern PEACE = {false, true, true, false, false};
constexpr Pattern FIST = {false, false, false, false, false};
constexpr Pattern PALM = {true, true, true, true, true};
constexpr Pattern THUMB = {true, false, false, false, false};
constexpr Pattern L_SHAPE = {true, true, false, false, false}; // no defined gesture

constexpr float HAND_SIZE = 65.19f;

inline HandSnapshot makeHand(const Pattern& extended, float wristX, float wristY,
                             float rotationDeg = 0.0f, float scale = 1.0f) {
    // Base geometry, wrist at origin
    std::vector<std::pair<float, float>> p(gestify::HAND_LANDMARK_COUNT);
    p[0] = {0.0f, 0.0f};

    if (extended[0]) {
        p[1] = {-15.0f, -10.0f};
        p[2] = {-30.0f, -25.0f};
        p[3] = {-45.0f, -38.0f};
        p[4] = {-70.0f, -55.0f};
    } else {
        p[1] = {-15.0f, -10.0f};
        p[2] = {-25.0f, -25.0f};
        p[3] = {-20.0f, -40.0f};
        p[4] = {-5.0f, -45.0f};
    }

    const std::array<std::pair<float, float>, 4> mcps = {{{-20.0f, -60.0f}, {-5.0f, -65.0f},
                                                          {10.0f, -62.0f}, {25.0f, -55.0f}}};
    for (size_t f = 0; f < 4; ++f) {
        const auto [mx, my] = mcps[f];
        const size_t base = 5 + f * 4;
        p[base] = {mx, my};
        if (extended[f + 1]) {
            p[base + 1] = {mx, my - 25.0f};
            p[base + 2] = {mx, my - 45.0f};
            p[base + 3] = {mx, my - 60.0f};
        } else {
            p[base + 1] = {mx, my - 20.0f};
            p[base + 2] = {mx, my - 10.0f};
            p[base + 3] = {mx, my + 5.0f};
        }
    }

    const float rad = rotationDeg * 3.14159265f / 180.0f;
    const float c = std::cos(rad);
    const float s = std::sin(rad);

    HandSnapshot hand;
    hand.keypoints.reserve(p.size());
    for (const auto& [x, y] : p) {
        float rx = (x * c - y * s) * scale;
        float ry = (x * s + y * c) * scale;
        hand.keypoints.push_back(Keypoint{wristX + rx, wristY + ry, 0.0f});
    }
    return hand;
}

// Index extended, thumb tip touching the index tip
inline HandSnapshot makePinchHand(float wristX, float wristY, float scale = 1.0f) {
    HandSnapshot hand = makeHand(POINT, wristX, wristY, 0.0f, scale);
    hand.keypoints[gestify::LandmarkIndices::THUMB_TIP] = Keypoint{wristX - 22.0f * scale, wristY - 112.0f * scale, 0.0f};
    return hand;
}

inline gestify::ShapeDescriptor makeShape(const Pattern& extended, float pinchDistance,
                                          gestify::ThumbDirection thumb = gestify::ThumbDirection::Sideways) {
    gestify::ShapeDescriptor shape;
    shape.extended = extended;
    shape.pinchDistance = pinchDistance;
    shape.thumbDirection = thumb;
    shape.handSize = HAND_SIZE;
    return shape;
}

// A face looking straight into a 1280x720 camera
inline gestify::FaceSnapshot attentiveFace() {
    gestify::FaceSnapshot face;
    face.leftEye = {580.0f, 300.0f, 0.0f};
    face.leftIris = {580.0f, 300.0f, 0.0f};
    face.rightEye = {700.0f, 300.0f, 0.0f};
    face.rightIris = {700.0f, 300.0f, 0.0f};
    face.noseTip = {640.0f, 360.0f, 0.0f};
    face.leftEdge = {500.0f, 340.0f, 0.0f};
    face.rightEdge = {780.0f, 340.0f, 0.0f};
    return face;
}

// Same face turned toward the image edge
inline gestify::FaceSnapshot distractedFace() {
    gestify::FaceSnapshot face = attentiveFace();
    face.noseTip = {120.0f, 360.0f, 0.0f};
    return face;
}

constexpr int IMAGE_WIDTH = 1280;
constexpr int IMAGE_HEIGHT = 720;
constexpr double FRAME_PERIOD = 1.0 / 30.0;

inline gestify::LandmarkFrame makeFrame(uint64_t index, std::vector<HandSnapshot> hands = {},
                                        bool withFace = false) {
    gestify::LandmarkFrame frame;
    frame.frameIndex = index;
    frame.timestamp = static_cast<double>(index) * FRAME_PERIOD;
    frame.imageWidth = IMAGE_WIDTH;
    frame.imageHeight = IMAGE_HEIGHT;
    for (auto& hand : hands) {
        hand.timestamp = frame.timestamp;
    }
    frame.hands = std::move(hands);
    if (withFace) {
        frame.face = attentiveFace();
    }
    return frame;
}

// Attention off so tests see every event the classifier produces
inline gestify::PipelineConfig alwaysAttending() {
    gestify::PipelineConfig config;
    config.gate.attentionEnabled = false;
    return config;
}

} // namespace fixtures
