#pragma once

#include "GestureEvent.hpp"
#include "SpscQueue.hpp"
#include "Types.hpp"
#include <chrono>

namespace gestify {

// Queue sizing (slots, power of two)
constexpr size_t FRAME_QUEUE_SIZE = 16;
constexpr size_t EVENT_QUEUE_SIZE = 256;

/**
 * Gesture event plus the host time it left the pipeline, used by the
 * sender to drop stale continuous events.
 */
struct OutboundEvent {
    GestureEvent event;
    std::chrono::steady_clock::time_point emittedAt;
};

// OscReceiver -> ProcessingLoop
using FrameQueue = SpscQueue<LandmarkFrame, FRAME_QUEUE_SIZE>;

// ProcessingLoop -> OscSender
using EventQueue = SpscQueue<OutboundEvent, EVENT_QUEUE_SIZE>;

} // namespace gestify
