#include "gestify/GestureEvent.hpp"
#include <iomanip>
#include <sstream>

namespace gestify {

bool isDiscrete(GestureKind kind) {
    switch (kind) {
        case GestureKind::Click:
        case GestureKind::DoubleClick:
        case GestureKind::PauseToggle:
        case GestureKind::Confirm:
        case GestureKind::Cancel:
        case GestureKind::RotateCW:
        case GestureKind::RotateCCW:
            return true;
        default:
            return false;
    }
}

bool mustDeliver(GestureKind kind) {
    return isDiscrete(kind) || kind == GestureKind::DragStart || kind == GestureKind::DragEnd;
}

bool hasPosition(GestureKind kind) {
    return kind == GestureKind::CursorMove || kind == GestureKind::DragStart ||
           kind == GestureKind::DragMove;
}

bool hasValue(GestureKind kind) {
    return kind == GestureKind::Scroll || kind == GestureKind::ZoomIn ||
           kind == GestureKind::ZoomOut || kind == GestureKind::RotateCW ||
           kind == GestureKind::RotateCCW;
}

const char* getKindName(GestureKind kind) {
    switch (kind) {
        case GestureKind::CursorMove:  return "CURSOR_MOVE";
        case GestureKind::Click:       return "CLICK";
        case GestureKind::DoubleClick: return "DOUBLE_CLICK";
        case GestureKind::DragStart:   return "DRAG_START";
        case GestureKind::DragMove:    return "DRAG_MOVE";
        case GestureKind::DragEnd:     return "DRAG_END";
        case GestureKind::Scroll:      return "SCROLL";
        case GestureKind::PauseToggle: return "PAUSE_TOGGLE";
        case GestureKind::Confirm:     return "CONFIRM";
        case GestureKind::Cancel:      return "CANCEL";
        case GestureKind::ZoomIn:      return "ZOOM_IN";
        case GestureKind::ZoomOut:     return "ZOOM_OUT";
        case GestureKind::RotateCW:    return "ROTATE_CW";
        case GestureKind::RotateCCW:   return "ROTATE_CCW";
        default: return "unknown";
    }
}

std::string describe(const GestureEvent& event) {
    std::stringstream ss;
    ss << getKindName(event.kind);
    if (hasPosition(event.kind)) {
        ss << std::fixed << std::setprecision(3) << "(" << event.x << ", " << event.y << ")";
    } else if (hasValue(event.kind)) {
        ss << std::fixed << std::setprecision(2) << "(" << event.value << ")";
    }
    ss << " hand=" << event.handId << "/" << getRoleName(event.role);
    return ss.str();
}

} // namespace gestify
