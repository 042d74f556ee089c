#include "gestify/HandSelector.hpp"
#include "gestify/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <tuple>

namespace gestify {

const char* getRoleName(HandRole role) {
    switch (role) {
        case HandRole::None: return "NONE";
        case HandRole::Primary: return "PRIMARY";
        case HandRole::Secondary: return "SECONDARY";
        default: return "UNKNOWN";
    }
}

namespace {

float distance(const Point2D& a, const Point2D& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

HandSelector::HandSelector(const PipelineConfig& config)
    : config_(config) {
}

void HandSelector::reset() {
    identities_.clear();
    swapRun_ = 0;
}

Point2D HandSelector::centroid(const HandSnapshot& hand) {
    Point2D c;
    if (hand.keypoints.empty()) {
        return c;
    }
    for (const auto& kp : hand.keypoints) {
        c.x += kp.x;
        c.y += kp.y;
    }
    c.x /= static_cast<float>(hand.keypoints.size());
    c.y /= static_cast<float>(hand.keypoints.size());
    return c;
}

float HandSelector::handSize(const HandSnapshot& hand) {
    if (hand.size > 0.0f || hand.keypoints.empty()) {
        return hand.size;
    }
    float minX = hand.keypoints[0].x, maxX = minX;
    float minY = hand.keypoints[0].y, maxY = minY;
    for (const auto& kp : hand.keypoints) {
        minX = std::min(minX, kp.x);
        maxX = std::max(maxX, kp.x);
        minY = std::min(minY, kp.y);
        maxY = std::max(maxY, kp.y);
    }
    return std::max(maxX - minX, maxY - minY);
}

HandIdentity* HandSelector::findByRole(HandRole role) {
    if (role == HandRole::None) {
        return nullptr;
    }
    for (auto& [id, identity] : identities_) {
        if (identity.role == role) {
            return &identity;
        }
    }
    return nullptr;
}

float HandSelector::nearestIdentityDistance(const Point2D& p) const {
    float best = std::numeric_limits<float>::max();
    for (const auto& [id, identity] : identities_) {
        best = std::min(best, distance(p, identity.lastPosition));
    }
    return best;
}

float HandSelector::primarySideRank(float x, int imageWidth) const {
    float fromMidline = x - 0.5f * static_cast<float>(imageWidth);
    return config_.selection.primaryOnRight ? fromMidline : -fromMidline;
}

void HandSelector::retire(uint32_t id, const char* reason, std::vector<HandIdentity>& retired) {
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return;
    }
    Logger::info("HandSelector: hand ", id, " (", getRoleName(it->second.role), ") destroyed, ", reason);
    retired.push_back(std::move(it->second));
    identities_.erase(it);
}

SelectionResult HandSelector::update(const std::vector<const HandSnapshot*>& hands, int imageWidth) {
    SelectionResult result;
    const auto& sel = config_.selection;

    for (auto& [id, identity] : identities_) {
        identity.seenThisFrame = false;
    }

    // 1. Rank candidates: size, boosted by proximity to a live identity
    std::vector<Candidate> candidates;
    candidates.reserve(hands.size());
    for (const HandSnapshot* hand : hands) {
        Candidate c;
        c.snapshot = hand;
        c.position = centroid(*hand);
        c.size = handSize(*hand);
        float d = nearestIdentityDistance(c.position);
        float proximity = d < sel.maxMatchDistance ? 1.0f - d / sel.maxMatchDistance : 0.0f;
        c.score = c.size * (1.0f + sel.continuityWeight * proximity);
        candidates.push_back(c);
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    if (candidates.size() > static_cast<size_t>(sel.maxHands)) {
        candidates.resize(static_cast<size_t>(sel.maxHands));
    }

    // 2. Greedy nearest association
    std::vector<std::tuple<float, uint32_t, size_t>> pairs;
    for (const auto& [id, identity] : identities_) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            float d = distance(candidates[i].position, identity.lastPosition);
            if (d <= sel.maxMatchDistance) {
                pairs.emplace_back(d, id, i);
            }
        }
    }
    std::sort(pairs.begin(), pairs.end());

    std::vector<HandIdentity*> assigned(candidates.size(), nullptr);
    std::set<uint32_t> matchedIds;
    for (const auto& [d, id, index] : pairs) {
        if (assigned[index] || matchedIds.count(id)) {
            continue;
        }
        assigned[index] = &identities_.at(id);
        matchedIds.insert(id);
    }

    // 3. Spawn identities for unmatched candidates
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (assigned[i]) {
            continue;
        }
        if (identities_.size() >= static_cast<size_t>(sel.maxHands)) {
            // Table full: every unmatched identity is still inside its grace
            // window, so the newcomer waits until a slot frees up
            Logger::debug("HandSelector: table full, hand at (", candidates[i].position.x, ", ",
                          candidates[i].position.y, ") not adopted");
            continue;
        }

        uint32_t id = nextId_++;
        auto it = identities_.emplace(id, HandIdentity(id, config_)).first;
        assigned[i] = &it->second;
        matchedIds.insert(id);
        Logger::info("HandSelector: hand ", id, " created at (", candidates[i].position.x, ", ",
                     candidates[i].position.y, ")");
    }

    // 4. Refresh matched identities
    for (size_t i = 0; i < candidates.size(); ++i) {
        HandIdentity* identity = assigned[i];
        if (!identity) {
            continue;
        }
        identity->lastPosition = candidates[i].position;
        identity->lastSize = candidates[i].size;
        identity->missedFrames = 0;
        identity->seenThisFrame = true;
        identity->framesTracked++;
    }

    // 5. Age unseen identities, destroy after the grace window
    std::vector<uint32_t> expired;
    for (auto& [id, identity] : identities_) {
        if (identity.seenThisFrame) {
            continue;
        }
        identity.missedFrames++;
        if (identity.missedFrames > sel.graceFrames) {
            expired.push_back(id);
        }
    }
    for (uint32_t id : expired) {
        retire(id, "grace expired", result.retired);
    }

    // 6. Roles
    assignFreeRoles(imageWidth);
    checkRoleSwap(imageWidth);

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (assigned[i]) {
            result.selected.push_back({assigned[i], candidates[i].snapshot});
        }
    }
    auto order = [](HandRole role) {
        return role == HandRole::Primary ? 0 : role == HandRole::Secondary ? 1 : 2;
    };
    std::stable_sort(result.selected.begin(), result.selected.end(),
                     [&order](const SelectedHand& a, const SelectedHand& b) {
                         return order(a.identity->role) < order(b.identity->role);
                     });
    return result;
}

void HandSelector::assignFreeRoles(int imageWidth) {
    std::vector<HandIdentity*> roleless;
    for (auto& [id, identity] : identities_) {
        if (identity.role == HandRole::None) {
            roleless.push_back(&identity);
        }
    }
    if (roleless.empty()) {
        return;
    }

    std::vector<HandRole> freeRoles;
    if (!findByRole(HandRole::Primary)) {
        freeRoles.push_back(HandRole::Primary);
    }
    if (config_.selection.maxHands > 1 && !findByRole(HandRole::Secondary)) {
        freeRoles.push_back(HandRole::Secondary);
    }
    if (freeRoles.empty()) {
        return;
    }

    // Two newcomers for two free roles: the one on the primary side of the
    // midline wins. A single newcomer takes PRIMARY first.
    if (roleless.size() >= 2 && freeRoles.size() == 2) {
        std::stable_sort(roleless.begin(), roleless.end(),
                         [this, imageWidth](const HandIdentity* a, const HandIdentity* b) {
                             return primarySideRank(a->lastPosition.x, imageWidth) >
                                    primarySideRank(b->lastPosition.x, imageWidth);
                         });
    }

    size_t n = std::min(roleless.size(), freeRoles.size());
    for (size_t i = 0; i < n; ++i) {
        roleless[i]->role = freeRoles[i];
        Logger::info("HandSelector: hand ", roleless[i]->id, " -> ", getRoleName(freeRoles[i]));
    }
}

void HandSelector::checkRoleSwap(int imageWidth) {
    HandIdentity* primary = findByRole(HandRole::Primary);
    HandIdentity* secondary = findByRole(HandRole::Secondary);
    if (!primary || !secondary || !primary->seenThisFrame || !secondary->seenThisFrame || imageWidth <= 0) {
        swapRun_ = 0;
        return;
    }

    const float midline = 0.5f * static_cast<float>(imageWidth);
    const float deadband = config_.selection.roleSwapDeadband * static_cast<float>(imageWidth);
    const float px = primary->lastPosition.x;
    const float sx = secondary->lastPosition.x;

    bool crossed = config_.selection.primaryOnRight
        ? (px < midline - deadband && sx > midline + deadband)
        : (px > midline + deadband && sx < midline - deadband);

    if (!crossed) {
        swapRun_ = 0;
        return;
    }
    if (++swapRun_ < config_.selection.roleSwapFrames) {
        return;
    }

    swapRun_ = 0;
    primary->role = HandRole::Secondary;
    secondary->role = HandRole::Primary;
    Logger::info("HandSelector: roles swapped, PRIMARY=", secondary->id, " SECONDARY=", primary->id);
}

} // namespace gestify
