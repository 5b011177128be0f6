// Abstract full-duplex session connection plus the dial contract used to open one.
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "../../engine/net/NetAddress.h"
#include "Envelope.h"

namespace Rumble::Net {

class SessionTransport {
public:
    virtual ~SessionTransport() = default;

    virtual bool send(const std::string& type, const nlohmann::json& payload) = 0;
    // Non-blocking; returns false when nothing is queued.
    virtual bool poll(Envelope& out) = 0;
    virtual bool isClosed() const = 0;
    virtual void close() = 0;
};

using SessionTransportPtr = std::unique_ptr<SessionTransport>;

// Runs on a worker thread. Returns nullptr and fills error on failure.
using Dialer = std::function<SessionTransportPtr(const Engine::Net::NetAddress& address, std::string& error)>;

struct DialResult {
    uint64_t attemptId{0};
    SessionTransportPtr transport;
    std::string error;

    bool ok() const { return transport != nullptr; }
};

}  // namespace Rumble::Net
