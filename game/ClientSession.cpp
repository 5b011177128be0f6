#include "ClientSession.h"

#include "../engine/core/Logger.h"
#include "net/NetMessages.h"

namespace Rumble {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

Net::ConnectionSettings connectionSettings(const ClientConfig& config) {
    Net::ConnectionSettings settings;
    settings.server = config.server;
    settings.retryBackoffSeconds = config.retryBackoffSeconds;
    return settings;
}

double fixedStepFor(const ClientConfig& config) {
    return config.window.tickRate > 0 ? 1.0 / config.window.tickRate : Engine::kFixedTickSeconds;
}

}  // namespace

ClientSession::ClientSession(ClientConfig config, Net::Dialer dialer, CredentialStore credentials,
                             std::unique_ptr<CredentialValidator> validator)
    : config_(std::move(config)),
      credentials_(std::move(credentials)),
      validator_(std::move(validator)),
      connection_(std::move(dialer), connectionSettings(config_)),
      clock_(fixedStepFor(config_)) {
    ctx_.platform = config_.platform;
    ctx_.playerName = config_.playerName.empty() ? "Player" : config_.playerName;
    registerHandlers();
}

void ClientSession::registerHandlers() {
    using namespace Net::MessageType;
    dispatcher_.registerHandler(Profile, [this](const nlohmann::json& d) { onProfile(d); });
    dispatcher_.registerHandler(Minis, [this](const nlohmann::json& d) { onMinis(d); });
    dispatcher_.registerHandler(Maps, [this](const nlohmann::json& d) { onMaps(d); });
    dispatcher_.registerHandler(Init, [this](const nlohmann::json& d) { onInit(d); });
    dispatcher_.registerHandler(HandUpdate, [this](const nlohmann::json& d) { onHandUpdate(d); });
    dispatcher_.registerHandler(StateDelta, [this](const nlohmann::json& d) { onStateDelta(d); });
    dispatcher_.registerHandler(FullSnapshot, [this](const nlohmann::json& d) { onFullSnapshot(d); });
    dispatcher_.registerHandler(UnitSpawnEvent, [this](const nlohmann::json& d) { onUnitSpawn(d); });
    dispatcher_.registerHandler(TimerUpdate, [this](const nlohmann::json& d) { onTimerUpdate(d); });
    dispatcher_.registerHandler(GameOver, [this](const nlohmann::json& d) { onGameOver(d); });
    dispatcher_.registerHandler(RoomCreated, [this](const nlohmann::json& d) { onRoomCreated(d); });
    dispatcher_.registerHandler(Error, [this](const nlohmann::json& d) { onError(d); });
    dispatcher_.registerHandler(LoggedOut, [this](const nlohmann::json& d) { onLoggedOut(d); });
    dispatcher_.registerHandler(GoldSynced, [this](const nlohmann::json& d) { onGoldSynced(d); });
    dispatcher_.registerHandler(VictoryEvent, [this](const nlohmann::json& d) { onVictoryEvent(d); });
    dispatcher_.registerHandler(DefeatEvent, [this](const nlohmann::json& d) { onDefeatEvent(d); });
    dispatcher_.registerHandler(RatingUpdate, [this](const nlohmann::json& d) { onRatingUpdate(d); });
    dispatcher_.registerHandler(MapDef, [this](const nlohmann::json& d) { onMapDef(d); });
}

void ClientSession::start() {
    const std::string token = credentials_.loadToken();
    if (token.empty()) {
        Engine::logInfo("No stored session; waiting for login.");
        return;
    }

    // Only a token the account API confirms is reused; anything else means a fresh login.
    const TokenStatus status = validator_ ? validator_->validate(token) : TokenStatus::Unreachable;
    Engine::logInfo(std::string("Stored session token is ") + toString(status) + ".");
    if (status != TokenStatus::Valid) {
        credentials_.clear();
        return;
    }

    const std::string username = credentials_.loadUsername();
    if (!username.empty()) {
        ctx_.username = username;
        ctx_.playerName = username;
    }
    connection_.startConnect();
}

void ClientSession::completeLogin(const std::string& username, const std::string& token) {
    const std::string name = trim(username);
    if (!credentials_.saveToken(token)) {
        Engine::logWarn("Session token could not be persisted; it will be needed again next launch.");
    }
    if (!name.empty()) {
        credentials_.saveUsername(name);
        ctx_.username = name;
        ctx_.playerName = name;
    }
    connection_.reset();
    connection_.startConnect();
}

void ClientSession::logout() {
    Engine::logInfo("Logging out.");
    credentials_.clear();
    resetToLogin();
}

void ClientSession::resetToLogin() {
    connection_.reset();
    resetMatchState();
    ctx_.playerId = 0;
    ctx_.username.clear();
    ctx_.playerName = config_.playerName.empty() ? "Player" : config_.playerName;
    ctx_.minis.clear();
    ctx_.maps.clear();
    ctx_.pvpStatus.clear();
    clearMapDef();
}

void ClientSession::clearMapDef() {
    ctx_.mapDef = Net::MapDefInfo{};
    ctx_.hasMapDef = false;
}

void ClientSession::resetMatchState() {
    world_.reset();
    effects_.clear();
    clock_.setPaused(false);
    ctx_.clearMatch();
}

void ClientSession::tick(double realDeltaSeconds) {
    connection_.update(realDeltaSeconds);
    connection_.processResults();
    if (connection_.takeConnectedEdge()) {
        sendInitialRequests();
    }
    if (connection_.state() == Net::ConnectionState::Connected) {
        if (auto* transport = connection_.transport()) {
            dispatcher_.drainAndDispatch(*transport);
        }
    }
    if (logoutPending_) {
        logoutPending_ = false;
        Engine::logInfo("Server ended the session.");
        credentials_.clear();
        resetToLogin();
    }

    const int steps = clock_.advance(realDeltaSeconds);
    for (int i = 0; i < steps; ++i) {
        const Engine::TimeStep step = clock_.consumeStep();
        world_.step(static_cast<float>(step.deltaSeconds));
        advanceTimer(step.deltaSeconds);
    }
    // Ghost bars read simulated time, so they hold still while paused.
    effects_.update(world_, clock_.nowMs());
}

void ClientSession::sendInitialRequests() {
    Net::SetNameMsg setName;
    setName.name = ctx_.playerName.empty() ? "Player" : ctx_.playerName;
    nlohmann::json payload;
    setName.serialize(payload);
    connection_.send(Net::MessageType::SetName, payload);
    connection_.send(Net::MessageType::GetProfile);
    connection_.send(Net::MessageType::ListMinis);
    connection_.send(Net::MessageType::ListMaps);
    connection_.send(Net::MessageType::GetGuild);
    connection_.send(Net::MessageType::GetFriends);
}

void ClientSession::advanceTimer(double dt) {
    if (!ctx_.inBattle || ctx_.gameOver || ctx_.timerRemainingSeconds <= 0) {
        return;
    }
    ctx_.timerAccumulator += dt;
    while (ctx_.timerAccumulator >= 1.0 && ctx_.timerRemainingSeconds > 0) {
        ctx_.timerAccumulator -= 1.0;
        --ctx_.timerRemainingSeconds;
    }
}

bool ClientSession::canPause() const { return ctx_.inBattle && !ctx_.gameOver && !isPvp(); }

bool ClientSession::pauseGame() {
    if (!canPause()) {
        Engine::logDebug("Pause ignored: not in a pausable match.");
        return false;
    }
    if (clock_.paused()) {
        return true;
    }
    clock_.setPaused(true);
    ctx_.pauseOverlay = true;
    connection_.send(Net::MessageType::PauseGame);
    return true;
}

bool ClientSession::resumeGame() {
    if (!clock_.paused()) {
        return false;
    }
    clock_.setPaused(false);
    ctx_.pauseOverlay = false;
    connection_.send(Net::MessageType::ResumeGame);
    return true;
}

bool ClientSession::togglePause() { return clock_.paused() ? resumeGame() : pauseGame(); }

bool ClientSession::restartMatch() {
    if (!ctx_.inBattle) {
        return false;
    }
    clock_.setPaused(false);
    ctx_.pauseOverlay = false;
    return connection_.send(Net::MessageType::RestartMatch);
}

bool ClientSession::surrenderMatch() {
    if (!ctx_.inBattle || ctx_.gameOver) {
        return false;
    }
    clock_.setPaused(false);
    ctx_.pauseOverlay = false;
    return connection_.send(Net::MessageType::SurrenderMatch);
}

bool ClientSession::leaveMatch() {
    connection_.send(Net::MessageType::LeaveRoom);
    const bool wasInMatch = ctx_.inBattle || !world_.empty();
    resetMatchState();
    clearMapDef();
    return wasInMatch;
}

MatchOutcome ClientSession::matchOutcome() const {
    if (ctx_.gameOver) {
        return ctx_.victory ? MatchOutcome::Victory : MatchOutcome::Defeat;
    }
    if (!ctx_.inBattle) {
        return MatchOutcome::Ongoing;
    }
    return world_.matchOutcome(ctx_.playerId, ctx_.timerRemainingSeconds);
}

void ClientSession::onProfile(const nlohmann::json& data) {
    Net::ProfileMsg msg;
    msg.deserialize(data);
    ctx_.playerId = msg.playerId;
    if (!trim(msg.name).empty()) {
        ctx_.playerName = msg.name;
    }
    ctx_.accountGold = msg.gold;
    ctx_.pvpRating = msg.pvpRating;
    ctx_.pvpRank = msg.pvpRank;
    ctx_.avatar = msg.avatar;
    Engine::logInfo("Profile loaded for " + ctx_.playerName + " (id " + std::to_string(ctx_.playerId) + ")");
}

void ClientSession::onMinis(const nlohmann::json& data) {
    Net::MinisMsg msg;
    msg.deserialize(data);
    ctx_.minis = std::move(msg.items);
}

void ClientSession::onMaps(const nlohmann::json& data) {
    Net::MapsMsg msg;
    msg.deserialize(data);
    ctx_.maps = std::move(msg.items);
    if (ctx_.currentArena.empty() && !ctx_.maps.empty()) {
        ctx_.currentArena = ctx_.maps.front().id;
    }
}

void ClientSession::onInit(const nlohmann::json& data) {
    Net::InitMsg msg;
    msg.deserialize(data);
    const std::string roomId = ctx_.roomId;
    resetMatchState();
    ctx_.roomId = roomId;
    ctx_.playerId = msg.playerId;
    ctx_.hand = std::move(msg.hand);
    ctx_.next = std::move(msg.next);
    ctx_.opponentAvatar = trim(msg.opponentAvatar);
    ctx_.inBattle = true;
    ctx_.timerRemainingSeconds = kDefaultMatchSeconds;
    Engine::logInfo("Match started in room " + (ctx_.roomId.empty() ? std::string("<none>") : ctx_.roomId));
}

void ClientSession::onHandUpdate(const nlohmann::json& data) {
    Net::HandUpdateMsg msg;
    msg.deserialize(data);
    ctx_.hand = std::move(msg.hand);
    ctx_.next = std::move(msg.next);
}

void ClientSession::onStateDelta(const nlohmann::json& data) {
    Net::StateDeltaMsg msg;
    msg.deserialize(data);
    // A paused match shows a frozen board; the snapshot after resume catches up.
    if (clock_.paused()) {
        return;
    }
    world_.applyDelta(msg);
}

void ClientSession::onFullSnapshot(const nlohmann::json& data) {
    Net::FullSnapshotMsg msg;
    msg.deserialize(data);
    world_.applySnapshot(msg);
    effects_.prune(world_);
}

void ClientSession::onUnitSpawn(const nlohmann::json& data) {
    Net::UnitSpawnEventMsg msg;
    msg.deserialize(data);
    world_.startSpawnAnimation(msg);
}

void ClientSession::onTimerUpdate(const nlohmann::json& data) {
    Net::TimerUpdateMsg msg;
    msg.deserialize(data);
    ctx_.timerRemainingSeconds = msg.remainingSeconds;
    ctx_.timerAccumulator = 0.0;
    clock_.setPaused(msg.isPaused);
    if (!msg.isPaused) {
        ctx_.pauseOverlay = false;
    }
}

void ClientSession::onGameOver(const nlohmann::json& data) {
    Net::GameOverMsg msg;
    msg.deserialize(data);
    finishMatch(msg.winnerId == ctx_.playerId);
    ctx_.gameOverReason = msg.reason;
    Engine::logInfo(std::string("Match over: ") + (ctx_.victory ? "victory" : "defeat") +
                    (msg.reason.empty() ? "" : " (" + msg.reason + ")"));
}

void ClientSession::onRoomCreated(const nlohmann::json& data) {
    Net::RoomCreatedMsg msg;
    msg.deserialize(data);
    ctx_.roomId = msg.roomId;
}

void ClientSession::onError(const nlohmann::json& data) {
    Net::ErrorMsg msg;
    msg.deserialize(data);
    ctx_.lastServerError = msg.message;
    Engine::logWarn("Server error" + (msg.code.empty() ? std::string() : " [" + msg.code + "]") + ": " +
                    msg.message);
}

void ClientSession::onLoggedOut(const nlohmann::json& /*data*/) {
    // The transport is still being drained; tear down after dispatch returns.
    logoutPending_ = true;
}

void ClientSession::onGoldSynced(const nlohmann::json& data) {
    Net::GoldSyncedMsg msg;
    msg.deserialize(data);
    ctx_.accountGold = msg.gold;
}

void ClientSession::finishMatch(bool victory) {
    ctx_.gameOver = true;
    ctx_.victory = victory;
    clock_.setPaused(false);
    ctx_.pauseOverlay = false;
}

void ClientSession::onVictoryEvent(const nlohmann::json& data) {
    Net::VictoryEventMsg msg;
    msg.deserialize(data);
    finishMatch(true);
    Engine::logInfo("Victory! Gold earned: " + std::to_string(msg.goldEarned) +
                    ", XP gained: " + std::to_string(msg.xpGained));
}

void ClientSession::onDefeatEvent(const nlohmann::json& data) {
    Net::DefeatEventMsg msg;
    msg.deserialize(data);
    finishMatch(false);
    Engine::logInfo("Defeat! Lost to " + (msg.winnerName.empty() ? std::string("opponent") : msg.winnerName));
}

void ClientSession::onRatingUpdate(const nlohmann::json& data) {
    Net::RatingUpdateMsg msg;
    msg.deserialize(data);
    if (msg.matchType != "queue") {
        return;
    }
    ctx_.pvpRating = msg.newRating;
    ctx_.pvpRank = msg.rank;
    const std::string sign = msg.delta < 0 ? "" : "+";
    ctx_.pvpStatus = ctx_.playerName + " (" + msg.rank + ") vs " + msg.oppName + " (" +
                     std::to_string(msg.oppRating) + "): " + (msg.delta > 0 ? "won" : "lost") + ", rating " +
                     sign + std::to_string(msg.delta) + " => " + std::to_string(msg.newRating);
    Engine::logInfo(ctx_.pvpStatus);
}

void ClientSession::onMapDef(const nlohmann::json& data) {
    Net::MapDefMsg msg;
    msg.deserialize(data);
    ctx_.mapDef = std::move(msg.def);
    ctx_.hasMapDef = true;
    if (ctx_.mapDef.isArena) {
        ctx_.currentArena = ctx_.mapDef.id;
    }
    Engine::logDebug("Map layout received: " + ctx_.mapDef.id);
}

}  // namespace Rumble
