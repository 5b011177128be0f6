// Background TCP transport that queues received frames for the game thread.
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "NetAddress.h"
#include "TcpSocket.h"

namespace Engine::Net {

class NetTransport {
public:
    NetTransport() = default;
    ~NetTransport();

    NetTransport(const NetTransport&) = delete;
    NetTransport& operator=(const NetTransport&) = delete;

    // Blocking dial; starts the receive thread on success.
    bool connect(const NetAddress& to, double timeoutSeconds, std::string& error);
    void stop();
    // True once the peer hung up, a read failed or stop() ran.
    bool isClosed() const { return closed_; }

    // Writes one length-prefixed frame.
    bool sendFrame(const std::vector<uint8_t>& body);
    bool sendFrame(const std::string& body);

    // Moves up to maxFrames complete frame bodies, oldest first, into out.
    void poll(std::vector<std::vector<uint8_t>>& out, std::size_t maxFrames = 64);
    std::size_t queuedFrames() const;

private:
    void recvLoop();

    TcpSocket socket_{};
    std::thread thread_{};
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{true};
    std::mutex sendMutex_{};
    mutable std::mutex queueMutex_{};
    std::deque<std::vector<uint8_t>> queue_{};
    NetAddress peer_{};
};

}  // namespace Engine::Net
