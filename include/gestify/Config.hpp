#pragma once

#include <stdexcept>
#include <string>

namespace gestify {

/**
 * Raised when a configuration value is out of range or a config file
 * cannot be read.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * Tuning surface of the gesture pipeline.
 *
 * Distances are image pixels unless noted. Pinch thresholds are
 * "px-equivalent": the thumb/index distance rescaled as if the hand were
 * referenceHandSize pixels long (wrist to middle MCP).
 *
 * Defaults are a starting point for a 1280x720 camera at arm's length and
 * should be re-tuned per deployment.
 */
struct PipelineConfig {
    struct Pinch {
        float grabThreshold = 60.0f;       // enter PINCH_HELD below this
        float releaseThreshold = 90.0f;    // leave PINCH_HELD above this
        float referenceHandSize = 200.0f;  // px
        int doubleClickFrames = 15;        // second pinch within N frames => DOUBLE_CLICK
    } pinch;

    struct Shape {
        float fingerMargin = 0.10f;        // x hand size
        float thumbMargin = 0.15f;         // x hand size
        float thumbVerticalRatio = 0.5f;   // |dy| / |d| needed for thumbs up/down
        int ambiguousHoldFrames = 3;       // unrecognised frames tolerated during a drag
    } shape;

    struct Selection {
        int maxHands = 2;
        float maxMatchDistance = 150.0f;   // px, identity association radius
        int graceFrames = 5;               // unseen frames before an identity is destroyed
        float continuityWeight = 1.0f;     // score bonus for hands near a live identity
        float roleSwapDeadband = 1.0f / 6.0f; // fraction of image width around the midline
        int roleSwapFrames = 3;            // consecutive crossed frames before roles swap
        bool primaryOnRight = true;        // PRIMARY belongs to the right half of the image
    } selection;

    struct Smoothing {
        int window = 5;                    // frames of history
        float newestWeight = 0.8f;         // weight of the newest sample
        bool oneEuro = false;              // run the cursor through a One-Euro filter instead
        double oneEuroMinCutoff = 1.0;
        double oneEuroBeta = 0.007;
    } smoothing;

    struct TwoHand {
        bool enabled = true;
        float zoomDeadband = 20.0f;        // px of separation change
        float rotateThresholdDeg = 15.0f;  // cumulative degrees before a rotate step
    } twoHand;

    struct Gate {
        double cooldownSeconds = 0.25;
        bool attentionEnabled = true;
        int attentionOnFrames = 3;
        int attentionOffFrames = 10;
    } gate;

    // Gaze bounds in normalised image units
    struct Attention {
        float maxGazeX = 0.015f;
        float minGazeY = -0.005f;
        float maxGazeY = 0.020f;
        float noseMinX = 0.3f;
        float noseMaxX = 0.7f;
        float minFaceWidth = 0.15f;
    } attention;

    struct Output {
        bool mirrorX = true;
        int screenWidth = 0;               // 0 => normalised 0..1 output
        int screenHeight = 0;
        float scrollGain = 0.05f;          // scroll units per px/s
        float scrollDeadband = 150.0f;     // px/s
    } output;

    /**
     * Throws ConfigError describing the first violated rule.
     */
    void validate() const;

    // Presets
    static PipelineConfig fastMode();
    static PipelineConfig accurateMode();
    static PipelineConfig twoHandMode();
};

/**
 * Host integration settings (not consumed by the core).
 */
struct ServiceConfig {
    std::string oscTargetHost = "127.0.0.1";
    std::string oscTargetPort = "9000";
    std::string oscListenPort = "9001";
    std::string logLevel = "info";
    int maxEventLatencyMs = 50;   // continuous events older than this are dropped

    void validate() const;
};

struct AppConfig {
    PipelineConfig pipeline;
    ServiceConfig service;
};

/**
 * Load a YAML/JSON config with cv::FileStorage. Missing keys keep their
 * defaults. Throws ConfigError on unreadable files or invalid values.
 */
AppConfig loadConfig(const std::string& path);

} // namespace gestify
