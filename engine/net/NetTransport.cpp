#include "NetTransport.h"

#include <algorithm>

#include "NetSerializer.h"
#include "../core/Logger.h"

namespace Engine::Net {

NetTransport::~NetTransport() { stop(); }

bool NetTransport::connect(const NetAddress& to, double timeoutSeconds, std::string& error) {
    stop();
    if (!socket_.connect(to, timeoutSeconds, error)) {
        return false;
    }
    peer_ = to;
    closed_ = false;
    running_ = true;
    thread_ = std::thread(&NetTransport::recvLoop, this);
    return true;
}

void NetTransport::stop() {
    running_ = false;
    socket_.shutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
    socket_.close();
    closed_ = true;
    std::scoped_lock lk(queueMutex_);
    queue_.clear();
}

bool NetTransport::sendFrame(const std::string& body) {
    return sendFrame(std::vector<uint8_t>(body.begin(), body.end()));
}

bool NetTransport::sendFrame(const std::vector<uint8_t>& body) {
    if (!running_ || closed_) return false;
    if (body.size() > kMaxFrameBytes) {
        logError("Refusing to send oversized frame (" + std::to_string(body.size()) + " bytes).");
        return false;
    }
    NetWriter writer;
    writer.writeU32(static_cast<uint32_t>(body.size()));
    writer.writeBytes(body.data(), body.size());
    std::scoped_lock lk(sendMutex_);
    if (!socket_.sendAll(writer.buffer().data(), writer.buffer().size())) {
        closed_ = true;
        return false;
    }
    return true;
}

void NetTransport::poll(std::vector<std::vector<uint8_t>>& out, std::size_t maxFrames) {
    std::scoped_lock lk(queueMutex_);
    std::size_t count = std::min(maxFrames, queue_.size());
    out.reserve(out.size() + count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
}

std::size_t NetTransport::queuedFrames() const {
    std::scoped_lock lk(queueMutex_);
    return queue_.size();
}

void NetTransport::recvLoop() {
    constexpr std::size_t kReadChunk = 16 * 1024;
    constexpr int kPollMs = 50;
    std::vector<uint8_t> buffer(kReadChunk);
    FrameReader reader;
    while (running_) {
        int read = socket_.receive(buffer.data(), buffer.size(), kPollMs);
        if (read == 0) {
            continue;
        }
        if (read < 0) {
            if (running_) {
                logInfo("Connection to " + peer_.toString() + " closed by peer.");
            }
            break;
        }
        reader.append(buffer.data(), static_cast<std::size_t>(read));
        bool ready = false;
        bool intact = true;
        for (;;) {
            std::vector<uint8_t> body;
            intact = reader.next(body, ready);
            if (!intact || !ready) {
                break;
            }
            std::scoped_lock lk(queueMutex_);
            queue_.push_back(std::move(body));
        }
        if (!intact) {
            logError("Corrupt frame header from " + peer_.toString() + "; dropping connection.");
            break;
        }
    }
    closed_ = true;
}

}  // namespace Engine::Net
