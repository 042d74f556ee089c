#pragma once

#include "Config.hpp"
#include "Types.hpp"
#include <optional>

namespace gestify {

/**
 * Debounced "user is attending" signal.
 *
 * Per frame the face (if any) is checked for forward gaze; the debounced
 * state turns on after attentionOnFrames consecutive attending frames and
 * off after attentionOffFrames consecutive non-attending frames. Starts off.
 * With attention disabled in the config the tracker always reports true.
 */
class AttentionTracker {
public:
    AttentionTracker(const PipelineConfig::Gate& gate, const PipelineConfig::Attention& attention);

    /**
     * Feed one frame. Image size normalises the face keypoints.
     * @return debounced attention state after this frame
     */
    bool update(const std::optional<FaceSnapshot>& face, int imageWidth, int imageHeight);

    /**
     * Raw single-frame gaze test.
     */
    [[nodiscard]] bool checkAttention(const FaceSnapshot& face, int imageWidth, int imageHeight) const;

    [[nodiscard]] bool isAttending() const { return attending_; }

    void reset();

private:
    PipelineConfig::Gate gate_;
    PipelineConfig::Attention bounds_;

    bool attending_ = false;
    int onRun_ = 0;
    int offRun_ = 0;
};

} // namespace gestify
