#pragma once

#include "Config.hpp"
#include "FingerState.hpp"
#include "GestureEvent.hpp"
#include <functional>
#include <vector>

namespace gestify {

enum class GestureState {
    IdleOpen = 0,   // no defined shape
    Pointing = 1,   // index only: cursor move
    PinchHeld = 2,  // thumb + index closed: click / double click on entry
    FistDrag = 3,   // all flexed: scroll by vertical velocity
    Palm = 4,       // all extended: pause toggle on entry
    ThumbUp = 5,    // thumb only, up: confirm on entry
    ThumbDown = 6,  // thumb only, down: cancel on entry
    PeaceDrag = 7   // index + middle: drag start / move / end
};

/**
 * Per-hand motion inputs from the temporal smoother.
 */
struct HandMotion {
    Point2D pointer;   // smoothed fingertip, already mapped to output space
    Point2D velocity;  // palm velocity, image px/s
};

/**
 * Finite state machine turning one hand's ShapeDescriptor stream into
 * gesture events.
 *
 * Precedence per frame:
 * 1. A held pinch stays held until pinchDistance rises above the release
 *    threshold (hysteresis: grab < release).
 * 2. A pinch enters below the grab threshold (unless the hand is a fist).
 * 3. Otherwise the finger pattern is looked up in the shape table; no match
 *    means IdleOpen, except that a drag survives a few ambiguous frames.
 *
 * Discrete events are emitted on state entry only. Cooldown and attention
 * are applied downstream by GestureGate.
 */
class GestureFSM {
public:
    using TransitionCallback = std::function<void(GestureState from, GestureState to)>;

    explicit GestureFSM(const PipelineConfig& config);

    /**
     * Advance one frame. Events produced by this frame are appended to out,
     * in order (a DragEnd always precedes the next state's entry event).
     * @return state after this frame
     */
    GestureState update(const ShapeDescriptor& shape, const HandMotion& motion,
                        std::vector<GestureEvent>& out);

    /**
     * Hand not seen this frame (identity still inside its grace window).
     * State is kept; only the double-click window ages.
     */
    void handleHandLost();

    /**
     * Identity destroyed: close an open drag and return to IdleOpen.
     */
    void terminate(std::vector<GestureEvent>& out);

    [[nodiscard]] GestureState getState() const { return state_; }
    [[nodiscard]] bool isDragActive() const { return state_ == GestureState::PeaceDrag; }
    [[nodiscard]] bool isPinched() const { return state_ == GestureState::PinchHeld; }

    [[nodiscard]] static const char* getStateName(GestureState state);

    /**
     * Shape-table lookup without pinch handling. IdleOpen when no pattern matches.
     */
    [[nodiscard]] static GestureState classifyShape(const ShapeDescriptor& shape);

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

    void reset();

private:
    PipelineConfig::Pinch pinch_;
    PipelineConfig::Output output_;
    int ambiguousHoldFrames_;

    GestureState state_ = GestureState::IdleOpen;
    int doubleClickFramesLeft_ = 0;
    int ambiguousFrames_ = 0;

    TransitionCallback transitionCallback_;

    void transitionTo(GestureState next, const HandMotion& motion, std::vector<GestureEvent>& out);
    void emitHeld(const HandMotion& motion, std::vector<GestureEvent>& out) const;
};

} // namespace gestify
