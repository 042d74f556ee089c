#pragma once

#include "Types.hpp"
#include <cstdint>
#include <string>

namespace gestify {

/**
 * Closed set of intents forwarded to the action executor.
 */
enum class GestureKind {
    CursorMove = 0,  // {x, y}
    Click,
    DoubleClick,
    DragStart,       // {x, y}
    DragMove,        // {x, y}
    DragEnd,
    Scroll,          // {value = delta, + is up}
    PauseToggle,
    Confirm,
    Cancel,
    ZoomIn,          // {value = factor >= 1}
    ZoomOut,         // {value = factor >= 1}
    RotateCW,        // {value = degrees}
    RotateCCW        // {value = degrees}
};

/**
 * One event of the tick's output stream. The payload fields used depend on
 * kind (see GestureKind); unused fields stay zero.
 */
struct GestureEvent {
    GestureKind kind = GestureKind::CursorMove;
    uint32_t handId = 0;
    HandRole role = HandRole::None;
    float x = 0.0f;
    float y = 0.0f;
    float value = 0.0f;
    double timestamp = 0.0;

    static GestureEvent positional(GestureKind kind, const Point2D& p) {
        GestureEvent e;
        e.kind = kind;
        e.x = p.x;
        e.y = p.y;
        return e;
    }

    static GestureEvent scalar(GestureKind kind, float value) {
        GestureEvent e;
        e.kind = kind;
        e.value = value;
        return e;
    }

    static GestureEvent signal(GestureKind kind) {
        GestureEvent e;
        e.kind = kind;
        return e;
    }
};

// One-shot gestures, subject to cooldown
[[nodiscard]] bool isDiscrete(GestureKind kind);

// Discrete gestures and drag start/end: never dropped on the way out, or
// the executor could be left holding a button
[[nodiscard]] bool mustDeliver(GestureKind kind);

// Carries x/y
[[nodiscard]] bool hasPosition(GestureKind kind);

// Carries value
[[nodiscard]] bool hasValue(GestureKind kind);

[[nodiscard]] const char* getKindName(GestureKind kind);

// "CLICK hand=1/PRIMARY", "ZOOM_IN(1.30) hand=1/PRIMARY", ...
[[nodiscard]] std::string describe(const GestureEvent& event);

} // namespace gestify
