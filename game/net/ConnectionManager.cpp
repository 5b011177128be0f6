#include "ConnectionManager.h"

#include <chrono>
#include <cmath>

#include "../../engine/core/Logger.h"

namespace Rumble::Net {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:
            return "Idle";
        case ConnectionState::Connecting:
            return "Connecting";
        case ConnectionState::Connected:
            return "Connected";
        case ConnectionState::Failed:
            return "Failed";
    }
    return "Unknown";
}

ConnectionManager::ConnectionManager(Dialer dialer, ConnectionSettings settings)
    : dialer_(std::move(dialer)), settings_(std::move(settings)), inbox_(std::make_shared<DialInbox>()) {}

ConnectionManager::~ConnectionManager() {
    {
        std::scoped_lock lk(inbox_->mutex);
        inbox_->abandoned = true;
    }
    closePendingResults();

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::duration<double>(kShutdownGraceSeconds);
    for (auto& worker : workers_) {
        while (!worker.done->load() && clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        if (worker.done->load()) {
            worker.thread.join();
        } else {
            Engine::logWarn("Dial still running at shutdown; leaving it to finish in the background.");
            worker.thread.detach();
        }
    }
}

void ConnectionManager::closePendingResults() {
    std::scoped_lock lk(inbox_->mutex);
    for (auto& result : inbox_->results) {
        if (result.transport) {
            result.transport->close();
        }
    }
    inbox_->results.clear();
}

void ConnectionManager::startConnect() {
    if (inFlight_) {
        return;
    }
    if (!dialer_) {
        fail("no dialer configured");
        return;
    }
    const uint64_t attemptId = ++nextAttempt_;
    activeAttempt_ = attemptId;
    inFlight_ = true;
    ++attemptsStarted_;
    setState(ConnectionState::Connecting);
    Engine::logInfo("Dialing " + settings_.server.toString() + " (attempt " + std::to_string(attemptId) + ")");

    auto done = std::make_shared<std::atomic<bool>>(false);
    Dialer dialer = dialer_;
    Engine::Net::NetAddress address = settings_.server;
    std::thread worker([inbox = inbox_, dialer, address, attemptId, done]() {
        DialResult result;
        result.attemptId = attemptId;
        result.transport = dialer(address, result.error);
        if (!result.transport && result.error.empty()) {
            result.error = "dial failed";
        }
        {
            std::scoped_lock lk(inbox->mutex);
            if (!inbox->abandoned) {
                inbox->results.push_back(std::move(result));
            } else if (result.transport) {
                result.transport->close();
            }
        }
        done->store(true);
    });
    workers_.push_back(Worker{std::move(worker), std::move(done)});
}

std::optional<DialResult> ConnectionManager::pollResult() {
    std::scoped_lock lk(inbox_->mutex);
    while (!inbox_->results.empty()) {
        DialResult result = std::move(inbox_->results.front());
        inbox_->results.pop_front();
        if (!inFlight_ || result.attemptId != activeAttempt_) {
            Engine::logDebug("Discarding stale dial result (attempt " + std::to_string(result.attemptId) + ")");
            if (result.transport) {
                result.transport->close();
            }
            continue;
        }
        return result;
    }
    return std::nullopt;
}

bool ConnectionManager::processResults() {
    auto result = pollResult();
    if (!result) {
        return false;
    }
    applyResult(std::move(*result));
    return true;
}

void ConnectionManager::applyResult(DialResult result) {
    inFlight_ = false;
    if (!result.ok()) {
        fail(result.error);
        return;
    }
    transport_ = std::move(result.transport);
    lastError_.clear();
    connectedEdge_ = true;
    setState(ConnectionState::Connected);
}

void ConnectionManager::update(double dt) {
    if (dt > 0.0) {
        time_ += dt;
    }
    reapWorkers();

    if (state_ == ConnectionState::Connected && (!transport_ || transport_->isClosed())) {
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
        fail("connection lost");
    }

    if (state_ == ConnectionState::Failed && !inFlight_ && time_ >= retryAt_) {
        startConnect();
    }
}

void ConnectionManager::reset() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    // Any worker still dialing now reports a stale attempt id.
    activeAttempt_ = 0;
    inFlight_ = false;
    connectedEdge_ = false;
    lastError_.clear();
    retryAt_ = 0.0;
    closePendingResults();
    setState(ConnectionState::Idle);
}

bool ConnectionManager::send(const std::string& type, const nlohmann::json& payload) {
    if (state_ != ConnectionState::Connected || !transport_) {
        Engine::logDebug("Dropping " + type + " while " + toString(state_));
        return false;
    }
    if (!transport_->send(type, payload)) {
        Engine::logWarn("Failed to send " + type + "; connection will be re-checked.");
        return false;
    }
    return true;
}

std::string ConnectionManager::statusText() const {
    switch (state_) {
        case ConnectionState::Idle:
            return "Offline";
        case ConnectionState::Connecting:
            return "Connecting...";
        case ConnectionState::Connected:
            return "Connected";
        case ConnectionState::Failed: {
            const double remaining = retryAt_ - time_;
            const int seconds = remaining > 0.0 ? static_cast<int>(std::ceil(remaining)) : 0;
            return "Connection failed: " + lastError_ + " (retrying in " + std::to_string(seconds) + "s)";
        }
    }
    return "Offline";
}

bool ConnectionManager::takeConnectedEdge() {
    const bool edge = connectedEdge_;
    connectedEdge_ = false;
    return edge;
}

void ConnectionManager::fail(const std::string& error) {
    lastError_ = error;
    retryAt_ = time_ + settings_.retryBackoffSeconds;
    Engine::logWarn("Connection failed: " + error);
    setState(ConnectionState::Failed);
}

void ConnectionManager::setState(ConnectionState next) {
    if (state_ == next) {
        return;
    }
    Engine::logDebug(std::string("Connection ") + toString(state_) + " -> " + toString(next));
    state_ = next;
}

void ConnectionManager::reapWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace Rumble::Net
