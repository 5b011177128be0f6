// Owns the connection, dispatcher, world and effects; runs the per-tick control flow.
#pragma once

#include <memory>
#include <string>

#include "../engine/core/SimulationClock.h"
#include "SessionContext.h"
#include "meta/ClientConfig.h"
#include "meta/CredentialStore.h"
#include "meta/CredentialValidator.h"
#include "net/ConnectionManager.h"
#include "net/MessageDispatcher.h"
#include "systems/EffectTracker.h"
#include "world/WorldModel.h"

namespace Rumble {

class ClientSession {
public:
    ClientSession(ClientConfig config, Net::Dialer dialer, CredentialStore credentials,
                  std::unique_ptr<CredentialValidator> validator);

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Stored credential check; connects only when the account API accepts the token.
    void start();
    void completeLogin(const std::string& username, const std::string& token);
    void logout();

    // connection -> dial results -> inbound messages -> fixed steps.
    void tick(double realDeltaSeconds);

    bool pauseGame();
    bool resumeGame();
    bool togglePause();
    bool restartMatch();
    bool surrenderMatch();
    bool leaveMatch();

    bool canPause() const;
    bool isPvp() const { return world_.isPvpMatch(ctx_.playerId, ctx_.roomId); }
    // Needs the match's map layout; without one the board is drawn as sent.
    bool shouldMirror() const { return ctx_.hasMapDef && world_.shouldMirror(ctx_.playerId, ctx_.roomId); }
    MatchOutcome matchOutcome() const;
    std::string statusText() const { return connection_.statusText(); }

    const SessionContext& context() const { return ctx_; }
    const WorldModel& world() const { return world_; }
    const EffectTracker& effects() const { return effects_; }
    const Engine::SimulationClock& clock() const { return clock_; }
    const Net::ConnectionManager& connection() const { return connection_; }
    Net::ConnectionManager& connection() { return connection_; }
    const Net::MessageDispatcher& dispatcher() const { return dispatcher_; }
    const ClientConfig& config() const { return config_; }

private:
    void registerHandlers();
    void sendInitialRequests();
    void resetToLogin();
    void resetMatchState();
    void clearMapDef();
    void finishMatch(bool victory);
    void advanceTimer(double dt);

    void onProfile(const nlohmann::json& data);
    void onMinis(const nlohmann::json& data);
    void onMaps(const nlohmann::json& data);
    void onInit(const nlohmann::json& data);
    void onHandUpdate(const nlohmann::json& data);
    void onStateDelta(const nlohmann::json& data);
    void onFullSnapshot(const nlohmann::json& data);
    void onUnitSpawn(const nlohmann::json& data);
    void onTimerUpdate(const nlohmann::json& data);
    void onGameOver(const nlohmann::json& data);
    void onRoomCreated(const nlohmann::json& data);
    void onError(const nlohmann::json& data);
    void onLoggedOut(const nlohmann::json& data);
    void onGoldSynced(const nlohmann::json& data);
    void onVictoryEvent(const nlohmann::json& data);
    void onDefeatEvent(const nlohmann::json& data);
    void onRatingUpdate(const nlohmann::json& data);
    void onMapDef(const nlohmann::json& data);

    ClientConfig config_;
    SessionContext ctx_;
    CredentialStore credentials_;
    std::unique_ptr<CredentialValidator> validator_;
    Net::ConnectionManager connection_;
    Net::MessageDispatcher dispatcher_;
    WorldModel world_;
    EffectTracker effects_;
    Engine::SimulationClock clock_;
    bool logoutPending_{false};
};

}  // namespace Rumble
