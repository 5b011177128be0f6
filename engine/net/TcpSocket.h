// Minimal cross-platform blocking TCP client socket.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "NetAddress.h"

namespace Engine::Net {

class TcpSocket {
public:
    TcpSocket() = default;
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Resolves and connects, giving up after timeoutSeconds. On failure `error` holds a reason.
    bool connect(const NetAddress& to, double timeoutSeconds, std::string& error);
    // Unblocks any pending receive; the descriptor stays valid until close().
    void shutdown();
    void close();
    bool isOpen() const;

    bool sendAll(const uint8_t* data, std::size_t len);
    // Waits up to timeoutMs. Returns bytes read, 0 on timeout, -1 on error or peer close.
    int receive(uint8_t* buffer, std::size_t maxLen, int timeoutMs);

private:
    int fd_{-1};
    bool wsaInit_{false};
};

}  // namespace Engine::Net
