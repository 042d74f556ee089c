#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace gestify {

// ============================================================
// Landmark model constants
// ============================================================

// MediaPipe-style hand model: 21 keypoints per hand, fixed order
constexpr size_t HAND_LANDMARK_COUNT = 21;
constexpr size_t FINGER_COUNT = 5;

// Roles available for tracked hands (PRIMARY + SECONDARY)
constexpr int MAX_TRACKED_HANDS = 2;

/**
 * Landmark indices of the hand model.
 */
struct LandmarkIndices {
    static constexpr int WRIST = 0;

    // Thumb
    static constexpr int THUMB_CMC = 1;
    static constexpr int THUMB_MCP = 2;
    static constexpr int THUMB_IP = 3;
    static constexpr int THUMB_TIP = 4;

    // Index finger
    static constexpr int INDEX_MCP = 5;
    static constexpr int INDEX_PIP = 6;
    static constexpr int INDEX_DIP = 7;
    static constexpr int INDEX_TIP = 8;

    // Middle finger
    static constexpr int MIDDLE_MCP = 9;
    static constexpr int MIDDLE_PIP = 10;
    static constexpr int MIDDLE_DIP = 11;
    static constexpr int MIDDLE_TIP = 12;

    // Ring finger
    static constexpr int RING_MCP = 13;
    static constexpr int RING_PIP = 14;
    static constexpr int RING_DIP = 15;
    static constexpr int RING_TIP = 16;

    // Pinky
    static constexpr int PINKY_MCP = 17;
    static constexpr int PINKY_PIP = 18;
    static constexpr int PINKY_DIP = 19;
    static constexpr int PINKY_TIP = 20;
};

// Finger order used by every per-finger array
enum class Finger {
    Thumb = 0,
    Index = 1,
    Middle = 2,
    Ring = 3,
    Pinky = 4
};

// ============================================================
// Data Structures
// ============================================================

struct Point2D {
    float x = 0.0f;
    float y = 0.0f;
};

// Image-space keypoint (pixels), z is the detector's relative depth
struct Keypoint {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/**
 * One detected hand for one frame, as delivered by the landmark detector.
 * size <= 0 means "not provided"; the pipeline derives it from the keypoint
 * bounding box.
 */
struct HandSnapshot {
    std::vector<Keypoint> keypoints;
    float size = 0.0f;
    double timestamp = 0.0; // seconds
};

/**
 * Face keypoints used for the attention check (image pixels).
 */
struct FaceSnapshot {
    Keypoint leftEye;
    Keypoint leftIris;
    Keypoint rightEye;
    Keypoint rightIris;
    Keypoint noseTip;
    Keypoint leftEdge;
    Keypoint rightEdge;
};

constexpr size_t FACE_LANDMARK_COUNT = 7;

/**
 * Everything the detector reports for one frame.
 */
struct LandmarkFrame {
    uint64_t frameIndex = 0;
    double timestamp = 0.0; // seconds
    int imageWidth = 0;
    int imageHeight = 0;

    std::vector<HandSnapshot> hands;
    std::optional<FaceSnapshot> face;
};

enum class HandRole {
    None = 0,
    Primary = 1,
    Secondary = 2
};

const char* getRoleName(HandRole role);

} // namespace gestify
