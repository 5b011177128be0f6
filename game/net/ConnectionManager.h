// Connection state machine: async dial attempts, fixed retry backoff, stale result rejection.
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../engine/net/NetAddress.h"
#include "SessionTransport.h"

namespace Rumble::Net {

enum class ConnectionState { Idle, Connecting, Connected, Failed };

const char* toString(ConnectionState state);

struct ConnectionSettings {
    Engine::Net::NetAddress server{};
    double retryBackoffSeconds{2.0};
};

class ConnectionManager {
public:
    // How long destruction waits for in-flight dials before leaving them behind.
    static constexpr double kShutdownGraceSeconds = 0.25;

    ConnectionManager(Dialer dialer, ConnectionSettings settings);
    // Dials still running after the grace period (a stuck resolver) are detached;
    // their results are closed by the worker. Dialers must own everything they touch.
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Spawns one dial worker unless an attempt is already in flight.
    void startConnect();
    // Next finished dial belonging to the active attempt; stale results are closed and skipped.
    std::optional<DialResult> pollResult();
    // Applies any finished dial to the state machine. Returns true if one was consumed.
    bool processResults();
    // Advances the manager clock, schedules retries and notices dropped connections.
    void update(double dt);
    // Drops the transport and any attempt; stays Idle until startConnect().
    void reset();

    bool send(const std::string& type, const nlohmann::json& payload = nlohmann::json::object());
    std::string statusText() const;
    // True exactly once after each successful (re)connection.
    bool takeConnectedEdge();

    ConnectionState state() const { return state_; }
    bool attemptInFlight() const { return inFlight_; }
    const std::string& lastError() const { return lastError_; }
    uint64_t attemptsStarted() const { return attemptsStarted_; }
    double retryAt() const { return retryAt_; }
    SessionTransport* transport() { return transport_.get(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Shared with the workers so a detached dial never touches a destroyed manager.
    struct DialInbox {
        std::mutex mutex;
        std::deque<DialResult> results;
        bool abandoned{false};
    };

    void applyResult(DialResult result);
    void fail(const std::string& error);
    void setState(ConnectionState next);
    void reapWorkers();
    void closePendingResults();

    Dialer dialer_;
    ConnectionSettings settings_;
    ConnectionState state_{ConnectionState::Idle};
    SessionTransportPtr transport_;

    double time_{0.0};
    double retryAt_{0.0};
    std::string lastError_;
    bool inFlight_{false};
    bool connectedEdge_{false};
    uint64_t activeAttempt_{0};
    uint64_t nextAttempt_{0};
    uint64_t attemptsStarted_{0};

    std::vector<Worker> workers_;
    std::shared_ptr<DialInbox> inbox_;
};

}  // namespace Rumble::Net
