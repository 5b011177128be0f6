// SessionTransport over the engine's framed TCP transport (one JSON envelope per frame).
#pragma once

#include <deque>
#include <memory>

#include "../../engine/net/NetTransport.h"
#include "SessionTransport.h"

namespace Rumble::Net {

class TcpSessionTransport final : public SessionTransport {
public:
    explicit TcpSessionTransport(std::unique_ptr<Engine::Net::NetTransport> transport);
    ~TcpSessionTransport() override;

    bool send(const std::string& type, const nlohmann::json& payload) override;
    bool poll(Envelope& out) override;
    bool isClosed() const override;
    void close() override;

private:
    void fill();

    std::unique_ptr<Engine::Net::NetTransport> transport_;
    std::deque<Envelope> pending_;
};

// Blocking dialer suitable for ConnectionManager worker threads.
Dialer makeTcpDialer(double timeoutSeconds);

}  // namespace Rumble::Net
