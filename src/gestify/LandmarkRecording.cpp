#include "gestify/LandmarkRecording.hpp"
#include "gestify/Logger.hpp"

#include <opencv2/core/persistence.hpp>
#include <stdexcept>

namespace gestify {

namespace {

constexpr size_t FLOATS_PER_POINT = 3;

std::vector<Keypoint> toKeypoints(const std::vector<float>& values) {
    std::vector<Keypoint> points;
    points.reserve(values.size() / FLOATS_PER_POINT);
    for (size_t i = 0; i + FLOATS_PER_POINT <= values.size(); i += FLOATS_PER_POINT) {
        points.push_back(Keypoint{values[i], values[i + 1], values[i + 2]});
    }
    return points;
}

void appendPoint(std::vector<float>& values, const Keypoint& kp) {
    values.push_back(kp.x);
    values.push_back(kp.y);
    values.push_back(kp.z);
}

LandmarkFrame readFrame(const cv::FileNode& node, size_t position) {
    LandmarkFrame frame;
    frame.frameIndex = node["index"].empty() ? position : static_cast<uint64_t>(static_cast<int>(node["index"]));
    frame.timestamp = node["timestamp"].real();
    frame.imageWidth = static_cast<int>(node["width"]);
    frame.imageHeight = static_cast<int>(node["height"]);

    cv::FileNode hands = node["hands"];
    for (auto it = hands.begin(); it != hands.end(); ++it) {
        cv::FileNode h = *it;
        HandSnapshot hand;
        std::vector<float> values;
        h["keypoints"] >> values;
        hand.keypoints = toKeypoints(values);
        hand.size = h["size"].empty() ? 0.0f : static_cast<float>(h["size"].real());
        hand.timestamp = frame.timestamp;
        frame.hands.push_back(std::move(hand));
    }

    cv::FileNode faceNode = node["face"];
    if (!faceNode.empty()) {
        std::vector<float> values;
        faceNode >> values;
        std::vector<Keypoint> points = toKeypoints(values);
        if (points.size() == FACE_LANDMARK_COUNT) {
            FaceSnapshot face;
            face.leftEye = points[0];
            face.leftIris = points[1];
            face.rightEye = points[2];
            face.rightIris = points[3];
            face.noseTip = points[4];
            face.leftEdge = points[5];
            face.rightEdge = points[6];
            frame.face = face;
        } else {
            Logger::warn("LandmarkRecording: frame ", frame.frameIndex, " face has ", points.size(),
                         " points, ignored");
        }
    }
    return frame;
}

} // namespace

std::vector<LandmarkFrame> LandmarkRecording::load(const std::string& path) {
    std::vector<LandmarkFrame> frames;
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw std::runtime_error("Cannot open recording: " + path);
        }
        cv::FileNode seq = fs["frames"];
        if (!seq.isSeq()) {
            throw std::runtime_error("Recording has no 'frames' sequence: " + path);
        }
        size_t position = 0;
        for (auto it = seq.begin(); it != seq.end(); ++it, ++position) {
            frames.push_back(readFrame(*it, position));
        }
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Cannot parse recording " + path + ": " + e.what());
    }

    Logger::info("LandmarkRecording: loaded ", frames.size(), " frames from ", path);
    return frames;
}

void LandmarkRecording::save(const std::string& path, const std::vector<LandmarkFrame>& frames) {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
        throw std::runtime_error("Cannot write recording: " + path);
    }

    fs << "frames" << "[";
    for (const auto& frame : frames) {
        fs << "{";
        fs << "index" << static_cast<int>(frame.frameIndex);
        fs << "timestamp" << frame.timestamp;
        fs << "width" << frame.imageWidth;
        fs << "height" << frame.imageHeight;

        fs << "hands" << "[";
        for (const auto& hand : frame.hands) {
            std::vector<float> values;
            for (const auto& kp : hand.keypoints) {
                appendPoint(values, kp);
            }
            fs << "{" << "size" << hand.size << "keypoints" << values << "}";
        }
        fs << "]";

        if (frame.face) {
            const FaceSnapshot& f = *frame.face;
            std::vector<float> values;
            for (const Keypoint* kp : {&f.leftEye, &f.leftIris, &f.rightEye, &f.rightIris,
                                       &f.noseTip, &f.leftEdge, &f.rightEdge}) {
                appendPoint(values, *kp);
            }
            fs << "face" << values;
        }
        fs << "}";
    }
    fs << "]";
    fs.release();
}

size_t LandmarkRecording::replay(GesturePipeline& pipeline, const std::vector<LandmarkFrame>& frames,
                                 const EventCallback& onEvent) {
    size_t count = 0;
    for (const auto& frame : frames) {
        for (const auto& event : pipeline.tick(frame)) {
            count++;
            if (onEvent) {
                onEvent(frame, event);
            }
        }
    }
    return count;
}

} // namespace gestify
