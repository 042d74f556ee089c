#pragma once

#include "GestureEvent.hpp"
#include "GesturePipeline.hpp"
#include "Types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace gestify {

/**
 * Recorded landmark frames on disk (YAML or JSON via cv::FileStorage).
 *
 *   frames:
 *     - { index: 0, timestamp: 0.033, width: 1280, height: 720,
 *         hands: [ { size: 0, keypoints: [x0, y0, z0, ... x20, y20, z20] } ],
 *         face: [x, y, z] x 7 }        # optional, FaceSnapshot field order
 *
 * Hands are stored as written; malformed hands are the pipeline's to drop.
 */
class LandmarkRecording {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static std::vector<LandmarkFrame> load(const std::string& path);

    static void save(const std::string& path, const std::vector<LandmarkFrame>& frames);

    using EventCallback = std::function<void(const LandmarkFrame&, const GestureEvent&)>;

    /**
     * Tick the pipeline over all frames in order.
     * @return number of events emitted
     */
    static size_t replay(GesturePipeline& pipeline, const std::vector<LandmarkFrame>& frames,
                         const EventCallback& onEvent);
};

} // namespace gestify
