#include "gestify/Config.hpp"
#include "gestify/Logger.hpp"

#include <opencv2/core/persistence.hpp>
#include <sstream>

namespace gestify {

namespace {

template<typename... Args>
[[noreturn]] void fail(Args... args) {
    std::stringstream ss;
    ss << "Invalid configuration: ";
    (ss << ... << args);
    throw ConfigError(ss.str());
}

void readValue(const cv::FileNode& node, const char* key, float& out) {
    cv::FileNode n = node[key];
    if (!n.empty()) out = static_cast<float>(n.real());
}

void readValue(const cv::FileNode& node, const char* key, double& out) {
    cv::FileNode n = node[key];
    if (!n.empty()) out = n.real();
}

void readValue(const cv::FileNode& node, const char* key, int& out) {
    cv::FileNode n = node[key];
    if (!n.empty()) out = static_cast<int>(n);
}

// Booleans are stored as 0/1 integers or the strings true/false
void readValue(const cv::FileNode& node, const char* key, bool& out) {
    cv::FileNode n = node[key];
    if (n.empty()) return;
    if (n.isString()) {
        std::string s = static_cast<std::string>(n);
        out = (s == "true" || s == "on" || s == "yes" || s == "1");
    } else {
        out = static_cast<int>(n) != 0;
    }
}

void readValue(const cv::FileNode& node, const char* key, std::string& out) {
    cv::FileNode n = node[key];
    if (n.empty()) return;
    if (n.isString()) {
        out = static_cast<std::string>(n);
    } else {
        // Allow ports written as plain numbers
        out = std::to_string(static_cast<int>(n));
    }
}

void readPipeline(const cv::FileNode& root, PipelineConfig& config) {
    cv::FileNode pinch = root["pinch"];
    if (!pinch.empty()) {
        readValue(pinch, "grab_threshold", config.pinch.grabThreshold);
        readValue(pinch, "release_threshold", config.pinch.releaseThreshold);
        readValue(pinch, "reference_hand_size", config.pinch.referenceHandSize);
        readValue(pinch, "double_click_frames", config.pinch.doubleClickFrames);
    }

    cv::FileNode shape = root["shape"];
    if (!shape.empty()) {
        readValue(shape, "finger_margin", config.shape.fingerMargin);
        readValue(shape, "thumb_margin", config.shape.thumbMargin);
        readValue(shape, "thumb_vertical_ratio", config.shape.thumbVerticalRatio);
        readValue(shape, "ambiguous_hold_frames", config.shape.ambiguousHoldFrames);
    }

    cv::FileNode selection = root["selection"];
    if (!selection.empty()) {
        readValue(selection, "max_hands", config.selection.maxHands);
        readValue(selection, "max_match_distance", config.selection.maxMatchDistance);
        readValue(selection, "grace_frames", config.selection.graceFrames);
        readValue(selection, "continuity_weight", config.selection.continuityWeight);
        readValue(selection, "role_swap_deadband", config.selection.roleSwapDeadband);
        readValue(selection, "role_swap_frames", config.selection.roleSwapFrames);
        readValue(selection, "primary_on_right", config.selection.primaryOnRight);
    }

    cv::FileNode smoothing = root["smoothing"];
    if (!smoothing.empty()) {
        readValue(smoothing, "window", config.smoothing.window);
        readValue(smoothing, "newest_weight", config.smoothing.newestWeight);
        readValue(smoothing, "one_euro", config.smoothing.oneEuro);
        readValue(smoothing, "one_euro_min_cutoff", config.smoothing.oneEuroMinCutoff);
        readValue(smoothing, "one_euro_beta", config.smoothing.oneEuroBeta);
    }

    cv::FileNode twoHand = root["two_hand"];
    if (!twoHand.empty()) {
        readValue(twoHand, "enabled", config.twoHand.enabled);
        readValue(twoHand, "zoom_deadband", config.twoHand.zoomDeadband);
        readValue(twoHand, "rotate_threshold_deg", config.twoHand.rotateThresholdDeg);
    }

    cv::FileNode gate = root["gate"];
    if (!gate.empty()) {
        readValue(gate, "cooldown_seconds", config.gate.cooldownSeconds);
        readValue(gate, "attention_enabled", config.gate.attentionEnabled);
        readValue(gate, "attention_on_frames", config.gate.attentionOnFrames);
        readValue(gate, "attention_off_frames", config.gate.attentionOffFrames);
    }

    cv::FileNode attention = root["attention"];
    if (!attention.empty()) {
        readValue(attention, "max_gaze_x", config.attention.maxGazeX);
        readValue(attention, "min_gaze_y", config.attention.minGazeY);
        readValue(attention, "max_gaze_y", config.attention.maxGazeY);
        readValue(attention, "nose_min_x", config.attention.noseMinX);
        readValue(attention, "nose_max_x", config.attention.noseMaxX);
        readValue(attention, "min_face_width", config.attention.minFaceWidth);
    }

    cv::FileNode output = root["output"];
    if (!output.empty()) {
        readValue(output, "mirror_x", config.output.mirrorX);
        readValue(output, "screen_width", config.output.screenWidth);
        readValue(output, "screen_height", config.output.screenHeight);
        readValue(output, "scroll_gain", config.output.scrollGain);
        readValue(output, "scroll_deadband", config.output.scrollDeadband);
    }
}

void readService(const cv::FileNode& root, ServiceConfig& config) {
    cv::FileNode service = root["service"];
    if (service.empty()) return;
    readValue(service, "osc_target_host", config.oscTargetHost);
    readValue(service, "osc_target_port", config.oscTargetPort);
    readValue(service, "osc_listen_port", config.oscListenPort);
    readValue(service, "log_level", config.logLevel);
    readValue(service, "max_event_latency_ms", config.maxEventLatencyMs);
}

} // namespace

void PipelineConfig::validate() const {
    // Pinch hysteresis: a release threshold at or below grab would let the
    // state machine oscillate on every frame
    if (pinch.grabThreshold <= 0.0f) {
        fail("pinch.grab_threshold must be > 0 (got ", pinch.grabThreshold, ")");
    }
    if (pinch.releaseThreshold <= pinch.grabThreshold) {
        fail("pinch.release_threshold (", pinch.releaseThreshold,
             ") must be greater than pinch.grab_threshold (", pinch.grabThreshold, ")");
    }
    if (pinch.referenceHandSize <= 0.0f) {
        fail("pinch.reference_hand_size must be > 0 (got ", pinch.referenceHandSize, ")");
    }
    if (pinch.doubleClickFrames < 0) {
        fail("pinch.double_click_frames must be >= 0 (got ", pinch.doubleClickFrames, ")");
    }

    if (shape.fingerMargin < 0.0f) {
        fail("shape.finger_margin must be >= 0 (got ", shape.fingerMargin, ")");
    }
    if (shape.thumbMargin < 0.0f) {
        fail("shape.thumb_margin must be >= 0 (got ", shape.thumbMargin, ")");
    }
    if (shape.thumbVerticalRatio <= 0.0f || shape.thumbVerticalRatio > 1.0f) {
        fail("shape.thumb_vertical_ratio must be in (0, 1] (got ", shape.thumbVerticalRatio, ")");
    }
    if (shape.ambiguousHoldFrames < 0) {
        fail("shape.ambiguous_hold_frames must be >= 0 (got ", shape.ambiguousHoldFrames, ")");
    }

    if (selection.maxHands < 1 || selection.maxHands > 2) {
        fail("selection.max_hands must be 1 or 2 (got ", selection.maxHands, ")");
    }
    if (selection.maxMatchDistance <= 0.0f) {
        fail("selection.max_match_distance must be > 0 (got ", selection.maxMatchDistance, ")");
    }
    if (selection.graceFrames < 0) {
        fail("selection.grace_frames must be >= 0 (got ", selection.graceFrames, ")");
    }
    if (selection.continuityWeight < 0.0f) {
        fail("selection.continuity_weight must be >= 0 (got ", selection.continuityWeight, ")");
    }
    if (selection.roleSwapDeadband < 0.0f || selection.roleSwapDeadband >= 0.5f) {
        fail("selection.role_swap_deadband must be in [0, 0.5) (got ", selection.roleSwapDeadband, ")");
    }
    if (selection.roleSwapFrames < 1) {
        fail("selection.role_swap_frames must be >= 1 (got ", selection.roleSwapFrames, ")");
    }

    if (smoothing.window < 1 || smoothing.window > 30) {
        fail("smoothing.window must be in [1, 30] (got ", smoothing.window, ")");
    }
    if (smoothing.newestWeight < 0.0f || smoothing.newestWeight > 1.0f) {
        fail("smoothing.newest_weight must be in [0, 1] (got ", smoothing.newestWeight, ")");
    }
    if (smoothing.oneEuroMinCutoff <= 0.0 || smoothing.oneEuroBeta < 0.0) {
        fail("smoothing.one_euro_min_cutoff must be > 0 and one_euro_beta >= 0");
    }

    if (twoHand.zoomDeadband < 0.0f) {
        fail("two_hand.zoom_deadband must be >= 0 (got ", twoHand.zoomDeadband, ")");
    }
    if (twoHand.rotateThresholdDeg <= 0.0f || twoHand.rotateThresholdDeg >= 180.0f) {
        fail("two_hand.rotate_threshold_deg must be in (0, 180) (got ", twoHand.rotateThresholdDeg, ")");
    }

    if (gate.cooldownSeconds < 0.0) {
        fail("gate.cooldown_seconds must be >= 0 (got ", gate.cooldownSeconds, ")");
    }
    if (gate.attentionOnFrames < 1 || gate.attentionOffFrames < 1) {
        fail("gate.attention_on_frames and gate.attention_off_frames must be >= 1");
    }

    if (attention.minGazeY >= attention.maxGazeY) {
        fail("attention.min_gaze_y must be below attention.max_gaze_y");
    }
    if (attention.noseMinX >= attention.noseMaxX) {
        fail("attention.nose_min_x must be below attention.nose_max_x");
    }
    if (attention.maxGazeX < 0.0f || attention.minFaceWidth < 0.0f) {
        fail("attention.max_gaze_x and attention.min_face_width must be >= 0");
    }

    if (output.screenWidth < 0 || output.screenHeight < 0) {
        fail("output.screen_width/screen_height must be >= 0");
    }
    if ((output.screenWidth == 0) != (output.screenHeight == 0)) {
        fail("output.screen_width and output.screen_height must both be set or both be 0");
    }
    if (output.scrollGain < 0.0f || output.scrollDeadband < 0.0f) {
        fail("output.scroll_gain and output.scroll_deadband must be >= 0");
    }
}

PipelineConfig PipelineConfig::fastMode() {
    PipelineConfig config;
    config.selection.maxHands = 1;
    config.gate.attentionEnabled = false;
    config.smoothing.window = 3;
    return config;
}

PipelineConfig PipelineConfig::accurateMode() {
    PipelineConfig config;
    config.smoothing.window = 7;
    config.gate.attentionOnFrames = 5;
    return config;
}

PipelineConfig PipelineConfig::twoHandMode() {
    PipelineConfig config;
    config.selection.maxHands = 2;
    config.twoHand.enabled = true;
    config.gate.attentionEnabled = true;
    return config;
}

void ServiceConfig::validate() const {
    if (oscTargetHost.empty() || oscTargetPort.empty()) {
        fail("service.osc_target_host and service.osc_target_port must be set");
    }
    if (oscListenPort.empty()) {
        fail("service.osc_listen_port must be set");
    }
    if (maxEventLatencyMs <= 0) {
        fail("service.max_event_latency_ms must be > 0 (got ", maxEventLatencyMs, ")");
    }
}

AppConfig loadConfig(const std::string& path) {
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            throw ConfigError("Cannot open config file: " + path);
        }
    } catch (const cv::Exception& e) {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }

    AppConfig config;
    try {
        cv::FileNode root = fs.root();
        readPipeline(root, config.pipeline);
        readService(root, config.service);
    } catch (const cv::Exception& e) {
        throw ConfigError("Malformed value in " + path + ": " + e.what());
    }

    config.pipeline.validate();
    config.service.validate();

    Logger::info("Config: loaded ", path);
    return config;
}

} // namespace gestify
