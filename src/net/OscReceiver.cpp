#include "net/OscReceiver.hpp"
#include "gestify/Logger.hpp"
#include <cstring>
#include <stdexcept>
#include <vector>

namespace net {

using gestify::Logger;

namespace {

constexpr size_t FLOATS_PER_POINT = 3;
constexpr uint64_t WARN_INTERVAL = 100;

gestify::Keypoint readPoint(const float* p) {
    return gestify::Keypoint{p[0], p[1], p[2]};
}

} // namespace

OscReceiver::OscReceiver(std::shared_ptr<gestify::FrameQueue> outputQueue, const std::string& port)
    : _outputQueue(std::move(outputQueue)), _port(port), _running(false) {
}

OscReceiver::~OscReceiver() {
    stop();
}

bool OscReceiver::decodeHand(const void* data, size_t size, float handSize, gestify::HandSnapshot& out) {
    const size_t floats = gestify::HAND_LANDMARK_COUNT * FLOATS_PER_POINT;
    if (!data || size != floats * sizeof(float)) {
        return false;
    }
    std::vector<float> values(floats);
    std::memcpy(values.data(), data, size);

    out.keypoints.clear();
    out.keypoints.reserve(gestify::HAND_LANDMARK_COUNT);
    for (size_t i = 0; i < gestify::HAND_LANDMARK_COUNT; ++i) {
        out.keypoints.push_back(readPoint(&values[i * FLOATS_PER_POINT]));
    }
    out.size = handSize;
    return true;
}

bool OscReceiver::decodeFace(const void* data, size_t size, gestify::FaceSnapshot& out) {
    const size_t floats = gestify::FACE_LANDMARK_COUNT * FLOATS_PER_POINT;
    if (!data || size != floats * sizeof(float)) {
        return false;
    }
    float values[gestify::FACE_LANDMARK_COUNT * FLOATS_PER_POINT];
    std::memcpy(values, data, size);

    gestify::Keypoint* fields[] = {&out.leftEye, &out.leftIris, &out.rightEye, &out.rightIris,
                                   &out.noseTip, &out.leftEdge, &out.rightEdge};
    for (size_t i = 0; i < gestify::FACE_LANDMARK_COUNT; ++i) {
        *fields[i] = readPoint(&values[i * FLOATS_PER_POINT]);
    }
    return true;
}

void OscReceiver::serverError(int num, const char* msg, const char* where) {
    Logger::error("OscReceiver: liblo error ", num, " in ", where ? where : "(unknown)", ": ",
                  msg ? msg : "");
}

void OscReceiver::start() {
    if (_running) return;

    _server = lo_server_thread_new(_port.c_str(), &OscReceiver::serverError);
    if (!_server) {
        throw std::runtime_error("OscReceiver: cannot listen on port " + _port);
    }

    lo_server_thread_add_method(_server, "/gestify/hand", "ifb", &OscReceiver::handMessage, this);
    lo_server_thread_add_method(_server, "/gestify/face", "ib", &OscReceiver::faceMessage, this);
    lo_server_thread_add_method(_server, "/gestify/frame", "idii", &OscReceiver::frameMessage, this);

    if (lo_server_thread_start(_server) < 0) {
        lo_server_thread_free(_server);
        _server = nullptr;
        throw std::runtime_error("OscReceiver: cannot start server thread on port " + _port);
    }

    _running = true;
    Logger::info("OscReceiver listening on port ", _port);
}

void OscReceiver::stop() {
    if (!_running) return;
    _running = false;
    lo_server_thread_stop(_server);
    lo_server_thread_free(_server);
    _server = nullptr;
    Logger::info("OscReceiver stopped. frames=", _framesCommitted.load(), " dropped=", _framesDropped.load());
}

void OscReceiver::beginFrame(uint64_t frameIndex) {
    if (_hasPending && _pending.frameIndex == frameIndex) {
        return;
    }
    if (_hasPending) {
        // The previous frame never got its /gestify/frame message
        _framesDropped++;
    }
    _pending = gestify::LandmarkFrame{};
    _pending.frameIndex = frameIndex;
    _hasPending = true;
}

int OscReceiver::handMessage(const char*, const char*, lo_arg** argv, int, lo_message, void* userData) {
    auto* self = static_cast<OscReceiver*>(userData);
    self->beginFrame(static_cast<uint64_t>(argv[0]->i));

    lo_blob blob = argv[2];
    gestify::HandSnapshot hand;
    if (!decodeHand(lo_blob_dataptr(blob), lo_blob_datasize(blob), argv[1]->f, hand)) {
        // Forward it anyway: the pipeline drops and counts malformed hands
        if (++self->_malformed % WARN_INTERVAL == 1) {
            Logger::warn("OscReceiver: hand blob of ", lo_blob_datasize(blob), " bytes, expected ",
                         gestify::HAND_LANDMARK_COUNT * FLOATS_PER_POINT * sizeof(float));
        }
    }
    self->_pending.hands.push_back(std::move(hand));
    return 0;
}

int OscReceiver::faceMessage(const char*, const char*, lo_arg** argv, int, lo_message, void* userData) {
    auto* self = static_cast<OscReceiver*>(userData);
    self->beginFrame(static_cast<uint64_t>(argv[0]->i));

    lo_blob blob = argv[1];
    gestify::FaceSnapshot face;
    if (decodeFace(lo_blob_dataptr(blob), lo_blob_datasize(blob), face)) {
        self->_pending.face = face;
    } else if (++self->_malformed % WARN_INTERVAL == 1) {
        Logger::warn("OscReceiver: face blob of ", lo_blob_datasize(blob), " bytes ignored");
    }
    return 0;
}

int OscReceiver::frameMessage(const char*, const char*, lo_arg** argv, int, lo_message, void* userData) {
    auto* self = static_cast<OscReceiver*>(userData);
    self->beginFrame(static_cast<uint64_t>(argv[0]->i));

    gestify::LandmarkFrame frame = std::move(self->_pending);
    self->_hasPending = false;
    frame.timestamp = argv[1]->d;
    frame.imageWidth = argv[2]->i;
    frame.imageHeight = argv[3]->i;
    for (auto& hand : frame.hands) {
        hand.timestamp = frame.timestamp;
    }

    if (self->_outputQueue->try_push(std::move(frame))) {
        self->_framesCommitted++;
    } else if (++self->_framesDropped % WARN_INTERVAL == 1) {
        Logger::warn("OscReceiver: frame queue full, dropped ", self->_framesDropped.load(), " frames");
    }
    return 0;
}

} // namespace net
