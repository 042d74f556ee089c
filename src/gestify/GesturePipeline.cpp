#include "gestify/GesturePipeline.hpp"
#include "gestify/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace gestify {

namespace {

// Warn on the first drop and then every N-th
constexpr uint64_t DROP_WARN_INTERVAL = 100;

const PipelineConfig& validated(const PipelineConfig& config) {
    config.validate();
    return config;
}

} // namespace

GesturePipeline::GesturePipeline(const PipelineConfig& config)
    : config_(validated(config)),
      attention_(config_.gate, config_.attention),
      selector_(config_),
      twoHand_(config_.twoHand, config_.output.mirrorX),
      gate_(config_.gate) {
    Logger::info("GesturePipeline: maxHands=", config_.selection.maxHands,
                 " pinch=", config_.pinch.grabThreshold, "/", config_.pinch.releaseThreshold,
                 " cooldown=", config_.gate.cooldownSeconds, "s",
                 " attention=", config_.gate.attentionEnabled ? "on" : "off");
}

void GesturePipeline::reset() {
    attention_.reset();
    selector_.reset();
    twoHand_.reset();
}

std::optional<GestureState> GesturePipeline::stateOf(HandRole role) {
    HandIdentity* identity = selector_.findByRole(role);
    if (!identity) {
        return std::nullopt;
    }
    return identity->gesture.getState();
}

std::optional<uint32_t> GesturePipeline::identityOf(HandRole role) {
    HandIdentity* identity = selector_.findByRole(role);
    if (!identity) {
        return std::nullopt;
    }
    return identity->id;
}

bool GesturePipeline::isWellFormed(const HandSnapshot& hand) const {
    if (hand.keypoints.size() != HAND_LANDMARK_COUNT) {
        return false;
    }
    for (const auto& kp : hand.keypoints) {
        if (!std::isfinite(kp.x) || !std::isfinite(kp.y) || !std::isfinite(kp.z)) {
            return false;
        }
    }
    return std::isfinite(hand.size) && handReferenceLength(hand) > 1e-3f;
}

void GesturePipeline::reportDropped(const LandmarkFrame& frame, const char* reason) {
    stats_.handsDropped++;
    if (stats_.handsDropped % DROP_WARN_INTERVAL == 1) {
        Logger::warn("GesturePipeline: frame ", frame.frameIndex, " hand dropped (", reason, "), ",
                     stats_.handsDropped, " total");
    }
}

Point2D GesturePipeline::mapToOutput(const Point2D& imagePoint, int imageWidth, int imageHeight) const {
    const auto& out = config_.output;
    float nx = imageWidth > 0 ? imagePoint.x / static_cast<float>(imageWidth) : 0.0f;
    float ny = imageHeight > 0 ? imagePoint.y / static_cast<float>(imageHeight) : 0.0f;
    if (out.mirrorX) {
        nx = 1.0f - nx;
    }
    nx = std::clamp(nx, 0.0f, 1.0f);
    ny = std::clamp(ny, 0.0f, 1.0f);

    if (out.screenWidth > 0 && out.screenHeight > 0) {
        return {nx * static_cast<float>(out.screenWidth - 1), ny * static_cast<float>(out.screenHeight - 1)};
    }
    return {nx, ny};
}

bool GesturePipeline::qualifiesForTwoHand(const HandWork& work) const {
    // Pinch-equivalent or open palm
    return work.identity->gesture.isPinched() ||
           work.shape.pinchDistance < config_.pinch.grabThreshold ||
           work.shape.extendedCount() == static_cast<int>(FINGER_COUNT);
}

void GesturePipeline::stamp(std::vector<GestureEvent>& events, const HandIdentity& identity,
                            double timestamp) const {
    for (auto& event : events) {
        event.handId = identity.id;
        event.role = identity.role;
        event.timestamp = timestamp;
    }
}

std::vector<GestureEvent> GesturePipeline::tick(const LandmarkFrame& frame) {
    stats_.ticks++;
    std::vector<GestureEvent> output;

    // 1. Validation
    std::vector<const HandSnapshot*> hands;
    hands.reserve(frame.hands.size());
    for (const auto& hand : frame.hands) {
        if (hand.keypoints.size() != HAND_LANDMARK_COUNT) {
            reportDropped(frame, "wrong keypoint count");
        } else if (!isWellFormed(hand)) {
            reportDropped(frame, "non-finite or degenerate keypoints");
        } else {
            hands.push_back(&hand);
        }
    }

    // 2. Attention
    const bool attending = attention_.update(frame.face, frame.imageWidth, frame.imageHeight);

    // 3. Selection
    SelectionResult selection = selector_.update(hands, frame.imageWidth);

    // Destroyed identities close their sessions before anything else
    for (auto& retired : selection.retired) {
        std::vector<GestureEvent> closing;
        retired.gesture.terminate(closing);
        stamp(closing, retired, frame.timestamp);
        gate_.filter(retired, closing, attending, output);
    }

    for (auto& [id, identity] : selector_.identities()) {
        if (!identity.seenThisFrame) {
            identity.gesture.handleHandLost();
        }
    }

    // 4. Per-hand classification
    std::vector<HandWork> work;
    work.reserve(selection.selected.size());
    for (const auto& selected : selection.selected) {
        HandWork w;
        w.identity = selected.identity;
        w.shape = extractShape(*selected.snapshot, config_.shape, config_.pinch.referenceHandSize);

        TemporalSmoother& smoother = w.identity->smoother;
        smoother.push(w.shape.indexTip, w.shape.palmCenter, frame.timestamp);

        HandMotion motion;
        motion.pointer = mapToOutput(smoother.smoothedPointer(), frame.imageWidth, frame.imageHeight);
        motion.velocity = smoother.velocity();

        w.identity->gesture.update(w.shape, motion, w.events);
        stamp(w.events, *w.identity, frame.timestamp);
        work.push_back(std::move(w));
    }

    // 5. Two-hand combinations
    std::vector<GestureEvent> pairEvents;
    HandWork* primary = nullptr;
    HandWork* secondary = nullptr;
    for (auto& w : work) {
        if (w.identity->role == HandRole::Primary) primary = &w;
        if (w.identity->role == HandRole::Secondary) secondary = &w;
    }

    const bool pairEngaged = config_.twoHand.enabled && primary && secondary &&
                             qualifiesForTwoHand(*primary) && qualifiesForTwoHand(*secondary);
    if (pairEngaged) {
        twoHand_.update(primary->identity->lastPosition, secondary->identity->lastPosition, pairEvents);
        stamp(pairEvents, *primary->identity, frame.timestamp);

        // The pair owns the gesture: no single-hand one-shots while engaged
        for (HandWork* w : {primary, secondary}) {
            w->events.erase(std::remove_if(w->events.begin(), w->events.end(),
                                           [](const GestureEvent& e) { return isDiscrete(e.kind); }),
                            w->events.end());
        }
    } else {
        twoHand_.reset();
    }

    // 6. Gate
    for (auto& w : work) {
        gate_.filter(*w.identity, w.events, attending, output);
    }
    if (primary) {
        gate_.filter(*primary->identity, pairEvents, attending, output);
    }

    stats_.eventsEmitted += output.size();
    for (const auto& event : output) {
        Logger::debug("GesturePipeline: frame ", frame.frameIndex, " ", describe(event));
    }
    return output;
}

} // namespace gestify
