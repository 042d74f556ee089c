#include "gestify/GestureGate.hpp"
#include "gestify/Logger.hpp"

namespace gestify {

GestureGate::GestureGate(const PipelineConfig::Gate& config)
    : config_(config) {
}

bool GestureGate::admit(HandIdentity& identity, const GestureEvent& event, bool attending) {
    switch (event.kind) {
        case GestureKind::DragMove:
            if (!identity.dragForwarded) {
                stats_.orphanDragDropped++;
                return false;
            }
            stats_.passed++;
            return true;

        case GestureKind::DragEnd:
            if (!identity.dragForwarded) {
                stats_.orphanDragDropped++;
                return false;
            }
            identity.dragForwarded = false;
            stats_.passed++;
            return true;

        default:
            break;
    }

    if (!attending) {
        stats_.attentionDropped++;
        Logger::debug("GestureGate: ", getKindName(event.kind), " hand=", identity.id, " dropped, not attending");
        return false;
    }

    if (event.kind == GestureKind::DragStart) {
        identity.dragForwarded = true;
        stats_.passed++;
        return true;
    }

    if (isDiscrete(event.kind)) {
        auto it = identity.lastFired.find(event.kind);
        if (it != identity.lastFired.end() && event.timestamp - it->second < config_.cooldownSeconds) {
            stats_.cooldownDropped++;
            Logger::debug("GestureGate: ", getKindName(event.kind), " hand=", identity.id,
                          " dropped, cooldown (", event.timestamp - it->second, "s)");
            return false;
        }
        identity.lastFired[event.kind] = event.timestamp;
    }

    stats_.passed++;
    return true;
}

void GestureGate::filter(HandIdentity& identity, const std::vector<GestureEvent>& events, bool attending,
                         std::vector<GestureEvent>& out) {
    for (const auto& event : events) {
        if (admit(identity, event, attending)) {
            out.push_back(event);
        }
    }
}

} // namespace gestify
