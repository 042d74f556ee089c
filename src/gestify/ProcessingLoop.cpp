#include "gestify/ProcessingLoop.hpp"
#include "gestify/Logger.hpp"

namespace gestify {

namespace {

constexpr int FPS_LOG_INTERVAL_MS = 5000;
constexpr uint64_t OVERFLOW_WARN_INTERVAL = 100;
constexpr size_t BACKLOG_WARN_SIZE = 64;

} // namespace

ProcessingLoop::ProcessingLoop(std::shared_ptr<FrameQueue> inputQueue,
                               std::shared_ptr<EventQueue> outputQueue,
                               const PipelineConfig& config)
    : _inputQueue(std::move(inputQueue)),
      _outputQueue(std::move(outputQueue)),
      _pipeline(config),
      _running(false) {
}

ProcessingLoop::~ProcessingLoop() {
    stop();
}

void ProcessingLoop::start() {
    if (_running) return;
    _running = true;
    _lastFpsTime = std::chrono::steady_clock::now();
    _thread = std::thread(&ProcessingLoop::loop, this);
    Logger::info("ProcessingLoop started.");
}

void ProcessingLoop::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    Logger::info("ProcessingLoop stopped. frames=", _framesProcessed.load(),
                 " events dropped=", _eventsDropped.load(), " undelivered=", _backlog.size());
}

bool ProcessingLoop::isRunning() const {
    return _running;
}

void ProcessingLoop::loop() {
    while (_running) {
        LandmarkFrame frame;
        if (_inputQueue->pop_front(frame)) {
            processFrame(frame);
        } else {
            flushBacklog();
            // Idle until the receiver commits the next frame
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }
}

void ProcessingLoop::processFrame(const LandmarkFrame& frame) {
    _frameCount++;
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - _lastFpsTime).count();
    if (elapsed >= FPS_LOG_INTERVAL_MS) {
        _currentFps = static_cast<float>(_frameCount) * 1000.0f / static_cast<float>(elapsed);
        _frameCount = 0;
        _lastFpsTime = now;
        Logger::info("ProcessingLoop: ", _currentFps, " fps, hands=", _pipeline.trackedHands(),
                     " attending=", _pipeline.isAttending() ? "yes" : "no");
    }

    std::vector<GestureEvent> events = _pipeline.tick(frame);

    flushBacklog();
    for (auto& event : events) {
        emit(OutboundEvent{event, now});
    }
    _framesProcessed++;
}

void ProcessingLoop::emit(OutboundEvent outbound) {
    // Anything queued behind a held-back event waits too, so order is kept
    if (_backlog.empty() && _outputQueue->try_push(outbound)) {
        return;
    }
    if (mustDeliver(outbound.event.kind)) {
        _backlog.push_back(std::move(outbound));
        _backlogSize = _backlog.size();
        if (_backlog.size() % BACKLOG_WARN_SIZE == 0) {
            Logger::warn("ProcessingLoop: event queue full, ", _backlog.size(), " events held back");
        }
        return;
    }
    uint64_t dropped = ++_eventsDropped;
    if (dropped % OVERFLOW_WARN_INTERVAL == 1) {
        Logger::warn("ProcessingLoop: event queue full, dropped ", describe(outbound.event),
                     " (", dropped, " total)");
    }
}

void ProcessingLoop::flushBacklog() {
    while (!_backlog.empty()) {
        if (!_outputQueue->try_push(_backlog.front())) {
            break;
        }
        _backlog.pop_front();
    }
    _backlogSize = _backlog.size();
}

} // namespace gestify
