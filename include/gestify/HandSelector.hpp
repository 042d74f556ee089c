#pragma once

#include "Config.hpp"
#include "HandIdentity.hpp"
#include "Types.hpp"
#include <map>
#include <vector>

namespace gestify {

struct SelectedHand {
    HandIdentity* identity = nullptr;     // points into the selector's table, valid for this tick
    const HandSnapshot* snapshot = nullptr;
};

struct SelectionResult {
    std::vector<SelectedHand> selected;   // PRIMARY first
    std::vector<HandIdentity> retired;    // destroyed this tick (grace expired)
};

/**
 * Picks at most maxHands hands per frame and keeps their identities and
 * roles stable.
 *
 * - Ranking: bounding size, boosted for hands near a live identity so a
 *   briefly larger background hand does not steal the slot.
 * - Association: greedy nearest match within maxMatchDistance.
 * - Lifetime: unmatched identities survive graceFrames unseen frames and
 *   keep their slot; a newcomer is adopted only once a slot is free.
 * - Roles: sticky; a freed role goes to a live identity without one. The
 *   two roles swap only after both hands sit beyond the midline deadband on
 *   the other's side for roleSwapFrames consecutive frames.
 */
class HandSelector {
public:
    explicit HandSelector(const PipelineConfig& config);

    /**
     * @param hands validated snapshots of this frame
     * @param imageWidth frame width in px, defines the midline
     */
    SelectionResult update(const std::vector<const HandSnapshot*>& hands, int imageWidth);

    [[nodiscard]] HandIdentity* findByRole(HandRole role);
    [[nodiscard]] std::map<uint32_t, HandIdentity>& identities() { return identities_; }
    [[nodiscard]] size_t liveCount() const { return identities_.size(); }

    void reset();

    /**
     * Keypoint centroid (px).
     */
    [[nodiscard]] static Point2D centroid(const HandSnapshot& hand);

    /**
     * Detector-provided size, or the larger side of the keypoint bounding box.
     */
    [[nodiscard]] static float handSize(const HandSnapshot& hand);

private:
    PipelineConfig config_;
    std::map<uint32_t, HandIdentity> identities_;
    uint32_t nextId_ = 1;
    int swapRun_ = 0;

    struct Candidate {
        const HandSnapshot* snapshot = nullptr;
        Point2D position;
        float size = 0.0f;
        float score = 0.0f;
    };

    float nearestIdentityDistance(const Point2D& p) const;
    void retire(uint32_t id, const char* reason, std::vector<HandIdentity>& retired);
    void assignFreeRoles(int imageWidth);
    void checkRoleSwap(int imageWidth);
    // Signed distance from the midline, positive on the PRIMARY side
    float primarySideRank(float x, int imageWidth) const;
};

} // namespace gestify
