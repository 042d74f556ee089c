#pragma once

#include "Config.hpp"
#include "GestureFSM.hpp"
#include "TemporalSmoother.hpp"
#include "Types.hpp"
#include <cstdint>
#include <map>

namespace gestify {

/**
 * "The same physical hand across frames".
 *
 * Created by HandSelector when it adopts a new detection, destroyed after
 * more than graceFrames unseen frames. Owns all per-hand session state:
 * smoothing history, gesture state machine and gate bookkeeping.
 */
struct HandIdentity {
    HandIdentity(uint32_t identityId, const PipelineConfig& config)
        : id(identityId), smoother(config.smoothing), gesture(config) {}

    uint32_t id = 0;
    HandRole role = HandRole::None;

    Point2D lastPosition;      // keypoint centroid, image px
    float lastSize = 0.0f;
    int missedFrames = 0;
    bool seenThisFrame = false;
    uint64_t framesTracked = 0;

    TemporalSmoother smoother;
    GestureFSM gesture;

    // Gate bookkeeping
    std::map<GestureKind, double> lastFired;  // discrete kind -> timestamp (s)
    bool dragForwarded = false;               // a DragStart went out, DragEnd pending
};

} // namespace gestify
