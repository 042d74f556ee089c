#include "gestify/GestureFSM.hpp"
#include "gestify/Logger.hpp"
#include <cmath>
#include <optional>

namespace gestify {

namespace {

enum class ThumbRule { Any, Up, Down };

struct ShapeRule {
    std::array<bool, FINGER_COUNT> fingers; // thumb, index, middle, ring, pinky
    ThumbRule thumb;
    GestureState state;
};

// Finger pattern => state. First match wins.
constexpr ShapeRule SHAPE_RULES[] = {
    {{false, true,  false, false, false}, ThumbRule::Any,  GestureState::Pointing},
    {{false, true,  true,  false, false}, ThumbRule::Any,  GestureState::PeaceDrag},
    {{false, false, false, false, false}, ThumbRule::Any,  GestureState::FistDrag},
    {{true,  true,  true,  true,  true},  ThumbRule::Any,  GestureState::Palm},
    {{true,  false, false, false, false}, ThumbRule::Up,   GestureState::ThumbUp},
    {{true,  false, false, false, false}, ThumbRule::Down, GestureState::ThumbDown},
};

struct StateActions {
    GestureState state;
    std::optional<GestureKind> onEnter;
    std::optional<GestureKind> whileHeld;
    bool heldOnEntry;                     // whileHeld also fires on the entry frame
    std::optional<GestureKind> onExit;
};

// State => events. PinchHeld's entry event is resolved at runtime (click vs double click).
const StateActions STATE_ACTIONS[] = {
    {GestureState::IdleOpen,  std::nullopt,               std::nullopt,             false, std::nullopt},
    {GestureState::Pointing,  std::nullopt,               GestureKind::CursorMove,  true,  std::nullopt},
    {GestureState::PinchHeld, GestureKind::Click,         std::nullopt,             false, std::nullopt},
    {GestureState::FistDrag,  std::nullopt,               GestureKind::Scroll,      true,  std::nullopt},
    {GestureState::Palm,      GestureKind::PauseToggle,   std::nullopt,             false, std::nullopt},
    {GestureState::ThumbUp,   GestureKind::Confirm,       std::nullopt,             false, std::nullopt},
    {GestureState::ThumbDown, GestureKind::Cancel,        std::nullopt,             false, std::nullopt},
    {GestureState::PeaceDrag, GestureKind::DragStart,     GestureKind::DragMove,    false, GestureKind::DragEnd},
};

const StateActions& actionsFor(GestureState state) {
    return STATE_ACTIONS[static_cast<int>(state)];
}

bool thumbMatches(ThumbRule rule, ThumbDirection direction) {
    switch (rule) {
        case ThumbRule::Up:   return direction == ThumbDirection::Up;
        case ThumbRule::Down: return direction == ThumbDirection::Down;
        default:              return true;
    }
}

} // namespace

GestureFSM::GestureFSM(const PipelineConfig& config)
    : pinch_(config.pinch),
      output_(config.output),
      ambiguousHoldFrames_(config.shape.ambiguousHoldFrames) {
    reset();
}

void GestureFSM::reset() {
    state_ = GestureState::IdleOpen;
    doubleClickFramesLeft_ = 0;
    ambiguousFrames_ = 0;
}

const char* GestureFSM::getStateName(GestureState state) {
    switch (state) {
        case GestureState::IdleOpen:  return "IDLE_OPEN";
        case GestureState::Pointing:  return "POINTING";
        case GestureState::PinchHeld: return "PINCH_HELD";
        case GestureState::FistDrag:  return "FIST_DRAG";
        case GestureState::Palm:      return "PALM";
        case GestureState::ThumbUp:   return "THUMB_UP";
        case GestureState::ThumbDown: return "THUMB_DOWN";
        case GestureState::PeaceDrag: return "PEACE_DRAG";
        default: return "unknown";
    }
}

GestureState GestureFSM::classifyShape(const ShapeDescriptor& shape) {
    for (const auto& rule : SHAPE_RULES) {
        if (shape.extended == rule.fingers && thumbMatches(rule.thumb, shape.thumbDirection)) {
            return rule.state;
        }
    }
    return GestureState::IdleOpen;
}

GestureState GestureFSM::update(const ShapeDescriptor& shape, const HandMotion& motion,
                                std::vector<GestureEvent>& out) {
    if (doubleClickFramesLeft_ > 0) {
        doubleClickFramesLeft_--;
    }

    GestureState next;
    if (state_ == GestureState::PinchHeld) {
        // Inside the hysteresis gap the pinch holds regardless of finger reading
        if (shape.pinchDistance <= pinch_.releaseThreshold) {
            return state_;
        }
        next = classifyShape(shape);
    } else if (shape.pinchDistance < pinch_.grabThreshold && !shape.longFingersFlexed()) {
        next = GestureState::PinchHeld;
    } else {
        next = classifyShape(shape);
    }

    if (next == GestureState::IdleOpen && state_ == GestureState::PeaceDrag &&
        ambiguousFrames_ < ambiguousHoldFrames_) {
        // Momentary misread during a drag: keep dragging
        ambiguousFrames_++;
        next = GestureState::PeaceDrag;
    } else if (next != GestureState::IdleOpen) {
        ambiguousFrames_ = 0;
    }

    if (next != state_) {
        transitionTo(next, motion, out);
    } else {
        emitHeld(motion, out);
    }
    return state_;
}

void GestureFSM::handleHandLost() {
    if (doubleClickFramesLeft_ > 0) {
        doubleClickFramesLeft_--;
    }
}

void GestureFSM::terminate(std::vector<GestureEvent>& out) {
    if (state_ != GestureState::IdleOpen) {
        transitionTo(GestureState::IdleOpen, HandMotion{}, out);
    }
    reset();
}

void GestureFSM::transitionTo(GestureState next, const HandMotion& motion, std::vector<GestureEvent>& out) {
    GestureState previous = state_;

    const StateActions& exitActions = actionsFor(previous);
    if (exitActions.onExit) {
        out.push_back(GestureEvent::signal(*exitActions.onExit));
    }

    state_ = next;
    ambiguousFrames_ = 0;

    const StateActions& enterActions = actionsFor(next);
    if (next == GestureState::PinchHeld) {
        if (doubleClickFramesLeft_ > 0) {
            out.push_back(GestureEvent::signal(GestureKind::DoubleClick));
            doubleClickFramesLeft_ = 0;
        } else {
            out.push_back(GestureEvent::signal(GestureKind::Click));
            doubleClickFramesLeft_ = pinch_.doubleClickFrames;
        }
    } else if (enterActions.onEnter) {
        if (hasPosition(*enterActions.onEnter)) {
            out.push_back(GestureEvent::positional(*enterActions.onEnter, motion.pointer));
        } else {
            out.push_back(GestureEvent::signal(*enterActions.onEnter));
        }
    }

    if (enterActions.heldOnEntry) {
        emitHeld(motion, out);
    }

    Logger::debug("GestureFSM: ", getStateName(previous), " -> ", getStateName(next));

    if (transitionCallback_) {
        transitionCallback_(previous, next);
    }
}

void GestureFSM::emitHeld(const HandMotion& motion, std::vector<GestureEvent>& out) const {
    const StateActions& actions = actionsFor(state_);
    if (!actions.whileHeld) {
        return;
    }

    GestureKind kind = *actions.whileHeld;
    if (kind == GestureKind::Scroll) {
        float vy = motion.velocity.y;
        if (std::fabs(vy) < output_.scrollDeadband) {
            return;
        }
        // Hand moving up (negative image y) scrolls up (positive delta)
        out.push_back(GestureEvent::scalar(GestureKind::Scroll, -vy * output_.scrollGain));
        return;
    }

    out.push_back(GestureEvent::positional(kind, motion.pointer));
}

} // namespace gestify
