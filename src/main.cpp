#include "gestify/Config.hpp"
#include "gestify/GesturePipeline.hpp"
#include "gestify/LandmarkRecording.hpp"
#include "gestify/Logger.hpp"
#include "gestify/ProcessingLoop.hpp"
#include "gestify/Queues.hpp"
#include "net/OscReceiver.hpp"
#include "net/OscSender.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

namespace {

void printUsage(const char* argv0) {
    gestify::Logger::info("Usage: ", argv0, " [config.yml] [--preset fast|accurate|two_hand] [--replay recording.yml]");
}

// Offline: tick the pipeline over a recording and print the event stream
int runReplay(const gestify::AppConfig& config, const std::string& path) {
    gestify::GesturePipeline pipeline(config.pipeline);
    auto frames = gestify::LandmarkRecording::load(path);

    size_t events = gestify::LandmarkRecording::replay(
        pipeline, frames, [](const gestify::LandmarkFrame& frame, const gestify::GestureEvent& event) {
            gestify::Logger::info("frame ", frame.frameIndex, ": ", gestify::describe(event));
        });

    const auto& stats = pipeline.getStats();
    const auto& gate = pipeline.getGateStats();
    gestify::Logger::info("Replay done: frames=", stats.ticks, " events=", events,
                          " hands dropped=", stats.handsDropped,
                          " cooldown suppressed=", gate.cooldownDropped,
                          " attention suppressed=", gate.attentionDropped);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    std::string replayPath;
    std::string preset;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--replay" && i + 1 < argc) {
            replayPath = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (configPath.empty() && arg.rfind("--", 0) != 0) {
            configPath = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    gestify::AppConfig config;
    try {
        if (!configPath.empty()) {
            config = gestify::loadConfig(configPath);
        }
        if (preset == "fast") {
            config.pipeline = gestify::PipelineConfig::fastMode();
        } else if (preset == "accurate") {
            config.pipeline = gestify::PipelineConfig::accurateMode();
        } else if (preset == "two_hand") {
            config.pipeline = gestify::PipelineConfig::twoHandMode();
        } else if (!preset.empty()) {
            gestify::Logger::error("Unknown preset: ", preset);
            return 1;
        }
    } catch (const gestify::ConfigError& e) {
        gestify::Logger::error(e.what());
        return 1;
    }

    gestify::Logger::setLevel(gestify::Logger::parseLevel(config.service.logLevel));

    if (!replayPath.empty()) {
        try {
            return runReplay(config, replayPath);
        } catch (const std::exception& e) {
            gestify::Logger::error("Replay failed: ", e.what());
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    gestify::Logger::info("Starting gestify service...");

    // Outer Loop for auto-restart
    while (g_running) {
        try {
            // 1. Queues
            auto frameQueue = std::make_shared<gestify::FrameQueue>();
            auto eventQueue = std::make_shared<gestify::EventQueue>();

            // 2. Event output to the action executor
            net::OscSender oscSender(eventQueue, config.service.oscTargetHost, config.service.oscTargetPort,
                                     config.service.maxEventLatencyMs);
            oscSender.start();

            // 3. Pipeline worker
            gestify::ProcessingLoop processingLoop(frameQueue, eventQueue, config.pipeline);
            processingLoop.start();

            // 4. Landmark input from the detector
            net::OscReceiver oscReceiver(frameQueue, config.service.oscListenPort);
            oscReceiver.start();

            gestify::Logger::info("Service running. Press Ctrl+C to exit.");

            while (g_running) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }

            // Stop in data-flow order
            gestify::Logger::info("Stopping modules...");
            oscReceiver.stop();
            processingLoop.stop();
            oscSender.stop();

        } catch (const gestify::ConfigError& e) {
            gestify::Logger::error(e.what());
            return 1;
        } catch (const std::exception& e) {
            gestify::Logger::error("Fatal error in service loop: ", e.what());
            if (g_running) {
                gestify::Logger::info("Retrying in 5 seconds...");
                std::this_thread::sleep_for(std::chrono::seconds(5));
            }
        }
    }

    gestify::Logger::info("Service stopped cleanly.");
    return 0;
}
