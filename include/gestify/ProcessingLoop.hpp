#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <thread>

#include "Config.hpp"
#include "GesturePipeline.hpp"
#include "Queues.hpp"

namespace gestify {

/**
 * Worker thread owning the GesturePipeline.
 *
 * Pops LandmarkFrames from the input queue, ticks the pipeline once per
 * frame and pushes the resulting events to the output queue. Ticks never
 * overlap since only this thread touches the pipeline.
 *
 * When the output queue is full, continuous events are dropped while
 * discrete events and drag start/end are held back in order and retried.
 */
class ProcessingLoop {
public:
    /**
     * @throws ConfigError if the pipeline configuration is invalid
     */
    ProcessingLoop(std::shared_ptr<FrameQueue> inputQueue,
                   std::shared_ptr<EventQueue> outputQueue,
                   const PipelineConfig& config);
    ~ProcessingLoop();

    void start();
    void stop();
    bool isRunning() const;

    uint64_t getFramesProcessed() const { return _framesProcessed; }
    uint64_t getEventsDropped() const { return _eventsDropped; }
    size_t getBacklog() const { return _backlogSize; }

private:
    void loop();
    void processFrame(const LandmarkFrame& frame);
    void emit(OutboundEvent outbound);
    // Retry held-back events, oldest first
    void flushBacklog();

    std::shared_ptr<FrameQueue> _inputQueue;
    std::shared_ptr<EventQueue> _outputQueue;
    GesturePipeline _pipeline;

    std::atomic<bool> _running;
    std::thread _thread;

    std::atomic<uint64_t> _framesProcessed{0};
    std::atomic<uint64_t> _eventsDropped{0};

    // Worker thread only
    std::deque<OutboundEvent> _backlog;
    std::atomic<size_t> _backlogSize{0};

    // FPS Counting
    std::chrono::steady_clock::time_point _lastFpsTime;
    int _frameCount = 0;
    float _currentFps = 0.0f;
};

} // namespace gestify
