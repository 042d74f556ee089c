#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <lo/lo.h>

#include "gestify/Queues.hpp"

namespace net {

/**
 * Receives landmark frames from the external detector over OSC and hands
 * complete frames to the processing queue.
 *
 * Per frame the detector sends, in order:
 *   /gestify/hand  i frame, f size, b keypoints   (0..K times)
 *   /gestify/face  i frame, b keypoints           (optional)
 *   /gestify/frame i frame, d timestamp (s), i width, i height
 *
 * Hand blobs are 21 x (x, y, z) float32 in image pixels, face blobs are
 * 7 x (x, y, z) float32 in the FaceSnapshot field order, both in host byte
 * order. /gestify/frame commits whatever arrived for that frame index.
 */
class OscReceiver {
public:
    OscReceiver(std::shared_ptr<gestify::FrameQueue> outputQueue, const std::string& port);
    ~OscReceiver();

    // Throws std::runtime_error if the port cannot be bound
    void start();
    void stop();

    uint64_t getFramesCommitted() const { return _framesCommitted; }
    uint64_t getFramesDropped() const { return _framesDropped; }

    static bool decodeHand(const void* data, size_t size, float handSize, gestify::HandSnapshot& out);
    static bool decodeFace(const void* data, size_t size, gestify::FaceSnapshot& out);

private:
    static int handMessage(const char* path, const char* types, lo_arg** argv, int argc,
                           lo_message msg, void* userData);
    static int faceMessage(const char* path, const char* types, lo_arg** argv, int argc,
                           lo_message msg, void* userData);
    static int frameMessage(const char* path, const char* types, lo_arg** argv, int argc,
                            lo_message msg, void* userData);
    static void serverError(int num, const char* msg, const char* where);

    // Start collecting for frameIndex, discarding a half-received older frame
    void beginFrame(uint64_t frameIndex);

    std::shared_ptr<gestify::FrameQueue> _outputQueue;
    std::string _port;
    lo_server_thread _server = nullptr;
    std::atomic<bool> _running;

    // Only touched from the liblo server thread
    gestify::LandmarkFrame _pending;
    bool _hasPending = false;

    std::atomic<uint64_t> _framesCommitted{0};
    std::atomic<uint64_t> _framesDropped{0};
    uint64_t _malformed = 0;
};

} // namespace net
