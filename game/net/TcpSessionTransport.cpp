#include "TcpSessionTransport.h"

#include <vector>

#include "../../engine/core/Logger.h"

namespace Rumble::Net {

TcpSessionTransport::TcpSessionTransport(std::unique_ptr<Engine::Net::NetTransport> transport)
    : transport_(std::move(transport)) {}

TcpSessionTransport::~TcpSessionTransport() { close(); }

bool TcpSessionTransport::send(const std::string& type, const nlohmann::json& payload) {
    if (!transport_ || transport_->isClosed()) {
        return false;
    }
    return transport_->sendFrame(encodeEnvelope(type, payload));
}

bool TcpSessionTransport::poll(Envelope& out) {
    if (pending_.empty()) {
        fill();
    }
    if (pending_.empty()) {
        return false;
    }
    out = std::move(pending_.front());
    pending_.pop_front();
    return true;
}

bool TcpSessionTransport::isClosed() const {
    // Frames already received stay readable after the peer hangs up.
    return (!transport_ || transport_->isClosed()) && pending_.empty() &&
           (!transport_ || transport_->queuedFrames() == 0);
}

void TcpSessionTransport::close() {
    if (transport_) {
        transport_->stop();
    }
    pending_.clear();
}

void TcpSessionTransport::fill() {
    if (!transport_) {
        return;
    }
    std::vector<std::vector<uint8_t>> frames;
    transport_->poll(frames);
    for (const auto& body : frames) {
        Envelope env;
        std::string error;
        const std::string text(body.begin(), body.end());
        if (!decodeEnvelope(text, env, error)) {
            Engine::logWarn("Dropping malformed envelope: " + error);
            continue;
        }
        pending_.push_back(std::move(env));
    }
}

Dialer makeTcpDialer(double timeoutSeconds) {
    return [timeoutSeconds](const Engine::Net::NetAddress& address, std::string& error) -> SessionTransportPtr {
        auto transport = std::make_unique<Engine::Net::NetTransport>();
        if (!transport->connect(address, timeoutSeconds, error)) {
            return nullptr;
        }
        return std::make_unique<TcpSessionTransport>(std::move(transport));
    };
}

}  // namespace Rumble::Net
