#include "gestify/AttentionTracker.hpp"
#include "gestify/Logger.hpp"
#include <cmath>

namespace gestify {

AttentionTracker::AttentionTracker(const PipelineConfig::Gate& gate, const PipelineConfig::Attention& attention)
    : gate_(gate), bounds_(attention) {
    reset();
}

void AttentionTracker::reset() {
    attending_ = !gate_.attentionEnabled;
    onRun_ = 0;
    offRun_ = 0;
}

bool AttentionTracker::checkAttention(const FaceSnapshot& face, int imageWidth, int imageHeight) const {
    if (imageWidth <= 0 || imageHeight <= 0) {
        return false;
    }
    const float w = static_cast<float>(imageWidth);
    const float h = static_cast<float>(imageHeight);

    // Iris offset from eye center, averaged over both eyes
    float gazeX = ((face.leftIris.x - face.leftEye.x) + (face.rightIris.x - face.rightEye.x)) / (2.0f * w);
    float gazeY = ((face.leftIris.y - face.leftEye.y) + (face.rightIris.y - face.rightEye.y)) / (2.0f * h);

    bool lookingForward = std::fabs(gazeX) < bounds_.maxGazeX;
    bool lookingAtScreen = gazeY > bounds_.minGazeY && gazeY < bounds_.maxGazeY;

    float noseX = face.noseTip.x / w;
    bool faceCentered = noseX > bounds_.noseMinX && noseX < bounds_.noseMaxX;

    // Narrow apparent face width = head turned away
    float faceWidth = std::fabs(face.rightEdge.x - face.leftEdge.x) / w;
    bool facingCamera = faceWidth > bounds_.minFaceWidth;

    return lookingForward && lookingAtScreen && faceCentered && facingCamera;
}

bool AttentionTracker::update(const std::optional<FaceSnapshot>& face, int imageWidth, int imageHeight) {
    if (!gate_.attentionEnabled) {
        attending_ = true;
        return attending_;
    }

    bool raw = face.has_value() && checkAttention(*face, imageWidth, imageHeight);
    if (raw) {
        onRun_++;
        offRun_ = 0;
        if (!attending_ && onRun_ >= gate_.attentionOnFrames) {
            attending_ = true;
            Logger::info("Attention: user attending");
        }
    } else {
        offRun_++;
        onRun_ = 0;
        if (attending_ && offRun_ >= gate_.attentionOffFrames) {
            attending_ = false;
            Logger::info("Attention: user not attending (", offRun_, " frames)");
        }
    }
    return attending_;
}

} // namespace gestify
