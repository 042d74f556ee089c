#pragma once

#include "Config.hpp"
#include "GestureEvent.hpp"
#include "HandIdentity.hpp"
#include <cstdint>
#include <vector>

namespace gestify {

/**
 * Cooldown and attention filter between the classifiers and the event
 * stream.
 *
 * - Discrete kinds are dropped if the same kind passed on the same identity
 *   less than cooldownSeconds earlier (frame timestamps, not wall clock).
 * - Everything is dropped while the user is not attending, except DragMove
 *   and DragEnd of a drag whose DragStart already went out.
 * - DragMove/DragEnd without a forwarded DragStart are dropped, so the
 *   executor only ever sees complete drag sessions.
 */
class GestureGate {
public:
    explicit GestureGate(const PipelineConfig::Gate& config);

    /**
     * @return true when the event may be emitted; updates the identity's
     *         cooldown and drag bookkeeping
     */
    bool admit(HandIdentity& identity, const GestureEvent& event, bool attending);

    /**
     * Append the admitted subset of events to out, preserving order.
     */
    void filter(HandIdentity& identity, const std::vector<GestureEvent>& events, bool attending,
                std::vector<GestureEvent>& out);

    struct Stats {
        uint64_t passed = 0;
        uint64_t cooldownDropped = 0;
        uint64_t attentionDropped = 0;
        uint64_t orphanDragDropped = 0;
    };
    [[nodiscard]] const Stats& getStats() const { return stats_; }

private:
    PipelineConfig::Gate config_;
    Stats stats_;
};

} // namespace gestify
