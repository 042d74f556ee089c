#pragma once

#include "AttentionTracker.hpp"
#include "Config.hpp"
#include "FingerState.hpp"
#include "GestureEvent.hpp"
#include "GestureFSM.hpp"
#include "GestureGate.hpp"
#include "HandSelector.hpp"
#include "TwoHandGestures.hpp"
#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace gestify {

/**
 * One tick = one LandmarkFrame in, zero or more GestureEvents out.
 *
 * Stages per tick:
 * 1. Drop malformed hands (wrong keypoint count, non-finite, degenerate)
 * 2. Attention debounce from the face keypoints
 * 3. Hand selection and identity/role bookkeeping
 * 4. Per hand: shape extraction, smoothing, gesture state machine
 * 5. Two-hand zoom/rotate when PRIMARY and SECONDARY both qualify
 * 6. Cooldown/attention gate
 *
 * Not thread-safe: the host must finish one tick before starting the next.
 */
class GesturePipeline {
public:
    /**
     * @throws ConfigError if the configuration is invalid
     */
    explicit GesturePipeline(const PipelineConfig& config);

    std::vector<GestureEvent> tick(const LandmarkFrame& frame);

    void reset();

    [[nodiscard]] const PipelineConfig& getConfig() const { return config_; }
    [[nodiscard]] bool isAttending() const { return attention_.isAttending(); }
    [[nodiscard]] size_t trackedHands() const { return selector_.liveCount(); }

    // State of the identity holding the role, if any
    [[nodiscard]] std::optional<GestureState> stateOf(HandRole role);
    [[nodiscard]] std::optional<uint32_t> identityOf(HandRole role);

    struct Stats {
        uint64_t ticks = 0;
        uint64_t handsDropped = 0;
        uint64_t eventsEmitted = 0;
    };
    [[nodiscard]] const Stats& getStats() const { return stats_; }
    [[nodiscard]] const GestureGate::Stats& getGateStats() const { return gate_.getStats(); }

    /**
     * Map an image-space point to the output space (mirror, normalise,
     * optional screen scaling, clamped to the output bounds).
     */
    [[nodiscard]] Point2D mapToOutput(const Point2D& imagePoint, int imageWidth, int imageHeight) const;

private:
    PipelineConfig config_;
    AttentionTracker attention_;
    HandSelector selector_;
    TwoHandGestures twoHand_;
    GestureGate gate_;
    Stats stats_;

    struct HandWork {
        HandIdentity* identity = nullptr;
        ShapeDescriptor shape;
        std::vector<GestureEvent> events;
    };

    bool isWellFormed(const HandSnapshot& hand) const;
    void reportDropped(const LandmarkFrame& frame, const char* reason);
    bool qualifiesForTwoHand(const HandWork& work) const;
    void stamp(std::vector<GestureEvent>& events, const HandIdentity& identity, double timestamp) const;
};

} // namespace gestify
