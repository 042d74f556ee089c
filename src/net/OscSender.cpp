#include "net/OscSender.hpp"
#include "gestify/Logger.hpp"
#include <cctype>

namespace net {

using gestify::GestureEvent;
using gestify::GestureKind;
using gestify::Logger;

OscSender::OscSender(std::shared_ptr<gestify::EventQueue> inputQueue, const std::string& host,
                     const std::string& port, int maxLatencyMs)
    : _inputQueue(std::move(inputQueue)), _host(host), _port(port),
      _maxLatency(maxLatencyMs), _running(false) {
}

OscSender::~OscSender() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

std::string OscSender::addressFor(GestureKind kind) {
    std::string path = "/gestify/";
    for (const char* c = gestify::getKindName(kind); *c; ++c) {
        path += static_cast<char>(std::tolower(static_cast<unsigned char>(*c)));
    }
    return path;
}

bool OscSender::isDroppable(GestureKind kind) {
    return !gestify::mustDeliver(kind);
}

void OscSender::start() {
    if (_running) return;

    _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    if (!_loAddress) {
        Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return;
    }

    _running = true;
    _thread = std::thread(&OscSender::loop, this);
    Logger::info("OscSender started. Target: ", _host, ":", _port);
}

void OscSender::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    Logger::info("OscSender stopped. sent=", _sent.load(), " stale=", _staleDropped.load());
}

void OscSender::loop() {
    while (_running) {
        gestify::OutboundEvent outbound;
        if (_inputQueue->pop_front(outbound)) {
            auto latency = std::chrono::steady_clock::now() - outbound.emittedAt;
            if (latency > _maxLatency && isDroppable(outbound.event.kind)) {
                _staleDropped++;
                continue;
            }
            send(outbound.event);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void OscSender::send(const GestureEvent& event) {
    if (!_loAddress) return;

    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, static_cast<int32_t>(event.handId));
    lo_message_add_int32(msg, static_cast<int32_t>(event.role));

    if (gestify::hasPosition(event.kind)) {
        lo_message_add_float(msg, event.x);
        lo_message_add_float(msg, event.y);
    } else if (gestify::hasValue(event.kind)) {
        lo_message_add_float(msg, event.value);
    }

    const std::string path = addressFor(event.kind);
    int ret = lo_send_message(_loAddress, path.c_str(), msg);
    if (ret == -1) {
        Logger::error("OscSender: Failed to send ", path, ": ", lo_address_errstr(_loAddress));
    } else {
        _sent++;
    }

    lo_message_free(msg);
}

} // namespace net
