#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <lo/lo.h>

#include "gestify/Queues.hpp"

namespace net {

/**
 * Forwards gesture events to the action executor, one OSC message per event.
 *
 * Address: /gestify/<kind>, e.g. /gestify/cursor_move, /gestify/zoom_in
 * Arguments: i handId, i role (0 none, 1 primary, 2 secondary), then
 *            ff x y for positional kinds or f value for scalar kinds.
 *
 * Continuous events that waited longer than maxLatencyMs in the queue are
 * dropped. Discrete events and drag start/end markers are always sent.
 */
class OscSender {
public:
    OscSender(std::shared_ptr<gestify::EventQueue> inputQueue, const std::string& host, const std::string& port,
              int maxLatencyMs);
    ~OscSender();

    void start();
    void stop();

    uint64_t getSent() const { return _sent; }
    uint64_t getStaleDropped() const { return _staleDropped; }

    // "/gestify/cursor_move"
    static std::string addressFor(gestify::GestureKind kind);

    // Kinds the sender may discard when stale
    static bool isDroppable(gestify::GestureKind kind);

private:
    void loop();
    void send(const gestify::GestureEvent& event);

    std::shared_ptr<gestify::EventQueue> _inputQueue;
    std::string _host;
    std::string _port;
    std::chrono::milliseconds _maxLatency;

    lo_address _loAddress = nullptr;

    std::atomic<bool> _running;
    std::thread _thread;

    std::atomic<uint64_t> _sent{0};
    std::atomic<uint64_t> _staleDropped{0};
};

} // namespace net
