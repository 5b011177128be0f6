// Client session end to end over an in-memory transport.
#include <cassert>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "../game/ClientSession.h"
#include "../game/meta/CredentialStore.h"
#include "../game/meta/CredentialValidator.h"
#include "../game/net/NetMessages.h"
#include "TestTransport.h"

using namespace Rumble;
using nlohmann::json;
using TestSupport::FakeLink;
using TestSupport::ScriptedDialer;

namespace {

constexpr double kFrame = 1.0 / 60.0;

class FakeValidator final : public CredentialValidator {
public:
    FakeValidator(TokenStatus status, int* calls) : status_(status), calls_(calls) {}
    TokenStatus validate(const std::string&) override {
        if (calls_) ++*calls_;
        return status_;
    }

private:
    TokenStatus status_;
    int* calls_;
};

std::filesystem::path freshDir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("rumble_session_tests_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

ClientConfig testConfig() {
    ClientConfig cfg;
    cfg.playerName = "Guest";
    cfg.window.tickRate = 60;
    return cfg;
}

std::unique_ptr<ClientSession> makeSession(ScriptedDialer& script, const std::filesystem::path& dir,
                                           TokenStatus status, int* validatorCalls = nullptr) {
    return std::make_unique<ClientSession>(testConfig(), script.dialer(), CredentialStore(dir),
                                           std::make_unique<FakeValidator>(status, validatorCalls));
}

bool connect(ClientSession& session) {
    return TestSupport::waitUntil([&session]() {
        session.tick(kFrame);
        return session.connection().state() == Net::ConnectionState::Connected;
    });
}

void pump(ClientSession& session, int frames = 1) {
    for (int i = 0; i < frames; ++i) session.tick(kFrame);
}

json base(int64_t owner, int y, int hp = 1000) {
    return json{{"ownerId", owner}, {"hp", hp}, {"maxHp", 1000}, {"x", 250}, {"y", y}, {"w", 100}, {"h", 60}};
}

}  // namespace

int main() {
    {
        // No stored token: stay on the login screen.
        const auto dir = freshDir("no_token");
        ScriptedDialer script;
        int calls = 0;
        auto session = makeSession(script, dir, TokenStatus::Valid, &calls);
        session->start();
        pump(*session, 5);
        assert(calls == 0);
        assert(session->connection().state() == Net::ConnectionState::Idle);
        assert(session->statusText() == "Offline");
        assert(script.dials() == 0);
        std::filesystem::remove_all(dir);
    }
    {
        // A rejected token is wiped and nothing is dialed.
        const auto dir = freshDir("rejected");
        CredentialStore store(dir);
        assert(store.saveToken("stale-token"));
        assert(store.saveUsername("Ana"));
        ScriptedDialer script;
        auto session = makeSession(script, dir, TokenStatus::Rejected);
        session->start();
        pump(*session, 5);
        assert(!store.hasToken());
        assert(store.loadUsername().empty());
        assert(session->connection().state() == Net::ConnectionState::Idle);
        std::filesystem::remove_all(dir);
    }
    {
        // A token that cannot be checked is treated like a rejected one.
        const auto dir = freshDir("unreachable");
        CredentialStore store(dir);
        assert(store.saveToken("tok"));
        assert(store.saveUsername("Ana"));
        ScriptedDialer script;
        int calls = 0;
        auto session = makeSession(script, dir, TokenStatus::Unreachable, &calls);
        session->start();
        pump(*session, 5);
        assert(calls == 1);
        assert(!store.hasToken());
        assert(store.loadUsername().empty());
        assert(session->context().username.empty());
        assert(session->connection().state() == Net::ConnectionState::Idle);
        assert(script.dials() == 0);
        std::filesystem::remove_all(dir);
    }
    {
        const auto dir = freshDir("flow");
        CredentialStore store(dir);
        assert(store.saveToken("tok"));
        assert(store.saveUsername("  Ana \n"));
        ScriptedDialer script;
        auto link = std::make_shared<FakeLink>();
        script.succeedWith(link);
        auto session = makeSession(script, dir, TokenStatus::Valid);
        session->start();
        assert(session->context().playerName == "Ana");
        assert(connect(*session));

        // Initial requests go out once, in order.
        const auto types = link->sentTypes();
        assert(types.size() == 6);
        assert(types[0] == "SetName" && types[1] == "GetProfile" && types[2] == "ListMinis");
        assert(types[3] == "ListMaps" && types[4] == "GetGuild" && types[5] == "GetFriends");
        assert(link->sent[0].data["name"] == "Ana");
        pump(*session, 3);
        assert(link->sent.size() == 6);
        link->clearSent();

        link->push("Profile", json{{"playerId", 7}, {"name", "Ana"}, {"gold", 120}, {"pvp_rating", 1500},
                                   {"pvp_rank", "Silver"}, {"avatar", "fox"}});
        link->push("Minis", json{{"items", json::array({json{{"name", "Archer"}, {"class", "range"}, {"cost", 3}}})}});
        link->push("Maps", json{{"items", json::array({json{{"id", "forest"}, {"name", "Forest"}},
                                                        json{{"id", "desert"}, {"name", "Desert"}}})}});
        link->push("Chat", json{{"text", "hi"}});
        pump(*session);
        const SessionContext& ctx = session->context();
        assert(ctx.playerId == 7);
        assert(ctx.accountGold == 120);
        assert(ctx.pvpRating == 1500 && ctx.pvpRank == "Silver");
        assert(ctx.minis.size() == 1 && ctx.minis[0].unitClass == "range");
        assert(ctx.maps.size() == 2);
        assert(ctx.currentArena == "forest");
        assert(session->dispatcher().unknownCount() == 1);

        // A malformed payload is dropped without touching the profile.
        link->push("Profile", json{{"playerId", "seven"}});
        link->push("GoldSynced", json{{"gold", 150}});
        pump(*session);
        assert(session->dispatcher().droppedCount() == 1);
        assert(ctx.playerId == 7);
        assert(ctx.accountGold == 150);

        // Practice match: pausable, not mirrored.
        link->push("RoomCreated", json{{"roomId", "room-3"}});
        link->push("Init", json{{"playerId", 7},
                                {"hand", json::array({json{{"name", "Archer"}, {"cost", 3}}})},
                                {"next", json{{"name", "Knight"}}},
                                {"opponentAvatar", " bot "}});
        link->push("FullSnapshot", json{{"tick", 1}, {"bases", json::array({base(7, 850), base(0, 100)})}});
        pump(*session);
        assert(ctx.inBattle && !ctx.gameOver);
        assert(ctx.roomId == "room-3");
        assert(ctx.timerRemainingSeconds == kDefaultMatchSeconds);
        assert(ctx.hand.size() == 1 && ctx.next.name == "Knight");
        assert(ctx.opponentAvatar == "bot");
        assert(!session->isPvp());
        assert(!session->shouldMirror());
        assert(session->matchOutcome() == MatchOutcome::Ongoing);

        pump(*session, 70);
        assert(ctx.timerRemainingSeconds == kDefaultMatchSeconds - 1);

        link->push("StateDelta",
                   json{{"tick", 2},
                        {"unitsUpsert", json::array({json{{"id", 5}, {"ownerId", 7}, {"x", 300}, {"y", 700},
                                                          {"hp", 100}, {"maxHp", 100}}})}});
        pump(*session);
        assert(session->world().unit(5) && session->world().unit(5)->hp == 100);

        assert(session->pauseGame());
        assert(session->clock().paused());
        assert(ctx.pauseOverlay);
        assert(link->countSent("PauseGame") == 1);
        const uint64_t stepsBefore = session->clock().stepCount();
        // Deltas that arrive while paused are dropped; the board stays frozen.
        link->push("StateDelta",
                   json{{"tick", 3},
                        {"unitsUpsert", json::array({json{{"id", 5}, {"ownerId", 7}, {"x", 320}, {"y", 650},
                                                          {"hp", 40}, {"maxHp", 100}},
                                                     json{{"id", 6}, {"ownerId", 0}, {"x", 300}, {"y", 200},
                                                          {"hp", 80}, {"maxHp", 80}}})}});
        pump(*session, 30);
        assert(session->world().unit(5)->hp == 100);
        assert(session->world().unit(5)->targetPos.x == 300.0f);
        assert(session->world().unit(5)->targetPos.y == 700.0f);
        assert(!session->world().unit(6));
        assert(session->effects().unit(5)->ghostHp == 100);
        assert(session->clock().stepCount() == stepsBefore);
        assert(ctx.timerRemainingSeconds == kDefaultMatchSeconds - 1);

        assert(session->togglePause());
        assert(!session->clock().paused());
        assert(!ctx.pauseOverlay);
        assert(link->countSent("ResumeGame") == 1);
        pump(*session, 3);
        assert(!session->world().unit(6));
        assert(session->world().unit(5)->hp == 100);

        // Server timer is authoritative for both time and pause.
        link->push("TimerUpdate", json{{"remainingSeconds", 42}, {"isPaused", true}});
        pump(*session);
        assert(ctx.timerRemainingSeconds == 42);
        assert(session->clock().paused());
        link->push("TimerUpdate", json{{"remainingSeconds", 41}, {"isPaused", false}});
        pump(*session);
        assert(!session->clock().paused());

        link->push("UnitSpawnEvent", json{{"unitId", 12}, {"unitX", 200}, {"unitY", 600}, {"unitName", "Knight"}});
        link->push("HandUpdate", json{{"hand", json::array({json{{"name", "Mage"}}, json{{"name", "Archer"}}})}});
        link->push("Error", json{{"code", "E_GOLD"}, {"message", "Not enough gold"}});
        pump(*session);
        assert(session->world().isSuppressed(12));
        assert(ctx.hand.size() == 2 && ctx.hand[0].name == "Mage");
        assert(ctx.lastServerError == "Not enough gold");

        assert(session->restartMatch());
        assert(link->countSent("RestartMatch") == 1);
        assert(session->surrenderMatch());
        assert(link->countSent("SurrenderMatch") == 1);

        link->push("GameOver", json{{"winner_id", 7}, {"reason", "base destroyed"}});
        pump(*session);
        assert(ctx.gameOver && ctx.victory);
        assert(ctx.gameOverReason == "base destroyed");
        assert(session->matchOutcome() == MatchOutcome::Victory);
        assert(!session->surrenderMatch());
        assert(!session->pauseGame());

        assert(session->leaveMatch());
        assert(link->countSent("LeaveRoom") == 1);
        assert(!ctx.inBattle && !ctx.gameOver);
        assert(ctx.roomId.empty());
        assert(session->world().empty());
        assert(session->effects().size() == 0);
        // Leaving with nothing open still tells the server.
        assert(!session->leaveMatch());
        assert(link->countSent("LeaveRoom") == 2);

        // PvP: no pause, mirrored when the own base sits in the top half.
        // The map layout may arrive before Init and must survive it.
        link->push("MapDef", json{{"Def", json{{"id", "arena-2"}, {"name", "Ridge"}, {"isArena", true}}}});
        link->push("RoomCreated", json{{"roomId", "pvp-9"}});
        link->push("Init", json{{"playerId", 7}});
        link->push("FullSnapshot", json{{"bases", json::array({base(7, 100), base(8, 850)})}});
        pump(*session);
        assert(ctx.hasMapDef && ctx.mapDef.id == "arena-2");
        assert(ctx.currentArena == "arena-2");
        assert(session->isPvp());
        assert(session->shouldMirror());
        assert(!session->canPause());
        assert(!session->pauseGame());
        assert(link->countSent("PauseGame") == 1);

        link->push("GameOver", json{{"winner_id", 8}});
        pump(*session);
        assert(!ctx.victory);
        assert(session->matchOutcome() == MatchOutcome::Defeat);

        // Server-side logout wipes credentials and returns to the login state.
        link->push("LoggedOut");
        pump(*session);
        assert(!store.hasToken());
        assert(session->connection().state() == Net::ConnectionState::Idle);
        assert(ctx.playerId == 0);
        assert(ctx.username.empty());
        assert(ctx.playerName == "Guest");
        assert(link->closed);
        std::filesystem::remove_all(dir);
    }
    {
        // Pause freezes smoothing, spawn drops and draining ghosts; resume continues from the frozen values.
        const auto dir = freshDir("pause_freeze");
        ScriptedDialer script;
        auto link = std::make_shared<FakeLink>();
        script.succeedWith(link);
        auto session = makeSession(script, dir, TokenStatus::Valid);
        session->completeLogin("Cy", "tok");
        assert(connect(*session));

        auto unit21 = [](int x, int hp) {
            return json{{"id", 21}, {"ownerId", 3}, {"x", x}, {"y", 500}, {"hp", hp}, {"maxHp", 100}};
        };
        link->push("RoomCreated", json{{"roomId", "room-5"}});
        link->push("Init", json{{"playerId", 3}});
        link->push("FullSnapshot", json{{"units", json::array({unit21(100, 100)})},
                                        {"bases", json::array({base(3, 850), base(0, 100)})}});
        pump(*session);
        assert(session->effects().unit(21)->ghostHp == 100);

        // The hit holds for 500 ms of simulated time, then drains over 300 ms.
        link->push("StateDelta", json{{"tick", 2}, {"unitsUpsert", json::array({unit21(100, 60)})}});
        pump(*session, 33);
        link->push("StateDelta", json{{"tick", 3}, {"unitsUpsert", json::array({unit21(300, 60)})}});
        link->push("UnitSpawnEvent", json{{"unitId", 22}, {"unitX", 300}, {"unitY", 800}, {"unitName", "Knight"}});
        pump(*session, 3);

        const float frozenX = session->world().unit(21)->renderPos.x;
        const SpawnAnimation* drop = session->world().activeSpawnAnimation(22);
        assert(drop);
        const float frozenProgress = drop->progress;
        const int frozenGhost = session->effects().unit(21)->ghostHp;
        assert(frozenX > 100.0f && frozenX < 300.0f);
        assert(frozenProgress > 0.0f && frozenProgress < 1.0f);
        assert(frozenGhost > 60 && frozenGhost < 100);

        assert(session->pauseGame());
        pump(*session, 30);
        assert(session->world().unit(21)->renderPos.x == frozenX);
        assert(session->world().activeSpawnAnimation(22)->progress == frozenProgress);
        assert(session->effects().unit(21)->ghostHp == frozenGhost);

        assert(session->resumeGame());
        pump(*session, 3);
        assert(session->world().unit(21)->renderPos.x > frozenX);
        assert(session->world().activeSpawnAnimation(22));
        assert(session->world().activeSpawnAnimation(22)->progress > frozenProgress);
        assert(session->effects().unit(21)->ghostHp < frozenGhost);
        assert(session->effects().unit(21)->ghostHp >= 60);

        pump(*session, 60);
        assert(session->world().unit(21)->renderPos.x == 300.0f);
        assert(!session->world().activeSpawnAnimation(22));
        assert(session->effects().unit(21)->ghostHp == 60);
        std::filesystem::remove_all(dir);
    }
    {
        // Match result, rating and map layout events.
        const auto dir = freshDir("match_events");
        ScriptedDialer script;
        auto link = std::make_shared<FakeLink>();
        script.succeedWith(link);
        auto session = makeSession(script, dir, TokenStatus::Valid);
        session->completeLogin("Dee", "tok");
        assert(connect(*session));
        const SessionContext& ctx = session->context();

        link->push("Profile", json{{"playerId", 4}, {"name", "Dee"}, {"pvp_rating", 1200}, {"pvp_rank", "Bronze"}});
        link->push("RoomCreated", json{{"roomId", "room-8"}});
        link->push("Init", json{{"playerId", 4}});
        pump(*session);
        assert(session->pauseGame());
        link->push("VictoryEvent", json{{"winnerId", 4}, {"winnerName", "Dee"}, {"goldEarned", 30}, {"xpGained", 12}});
        pump(*session);
        assert(ctx.gameOver && ctx.victory);
        assert(!session->clock().paused());
        assert(!ctx.pauseOverlay);
        assert(session->matchOutcome() == MatchOutcome::Victory);

        link->push("RoomCreated", json{{"roomId", "room-9"}});
        link->push("Init", json{{"playerId", 4}});
        pump(*session);
        assert(ctx.inBattle && !ctx.gameOver);
        link->push("DefeatEvent", json{{"loserId", 4}, {"winnerId", 0}, {"winnerName", "Warden"}});
        pump(*session);
        assert(ctx.gameOver && !ctx.victory);
        assert(session->matchOutcome() == MatchOutcome::Defeat);

        // Friendly games leave the ladder alone.
        link->push("RatingUpdate", json{{"new_rating", 1300}, {"delta", 100}, {"rank", "Gold"}, {"match_type", "friendly"}});
        pump(*session);
        assert(ctx.pvpRating == 1200 && ctx.pvpRank == "Bronze");
        assert(ctx.pvpStatus.empty());
        link->push("RatingUpdate", json{{"new_rating", 1184}, {"delta", -16}, {"rank", "Bronze"},
                                        {"opp_name", "Rex"}, {"opp_rating", 1250}, {"match_type", "queue"}});
        pump(*session);
        assert(ctx.pvpRating == 1184 && ctx.pvpRank == "Bronze");
        assert(ctx.pvpStatus.find("Dee (Bronze) vs Rex (1250)") == 0);
        assert(ctx.pvpStatus.find("lost") != std::string::npos);
        assert(ctx.pvpStatus.find("-16 => 1184") != std::string::npos);
        assert(session->leaveMatch());

        // Without a map layout the PvP board is drawn as sent.
        link->push("RoomCreated", json{{"roomId", "pvp-3"}});
        link->push("Init", json{{"playerId", 4}});
        link->push("FullSnapshot", json{{"bases", json::array({base(4, 100), base(5, 850)})}});
        pump(*session);
        assert(session->isPvp());
        assert(!ctx.hasMapDef);
        assert(!session->shouldMirror());

        // A non-arena layout is stored but does not change the arena.
        const std::string arenaBefore = ctx.currentArena;
        link->push("MapDef", json{{"Def", json{{"id", "lanes-1"}, {"width", 600}, {"height", 1000},
                                               {"playerBase", json{{"x", 0.5}, {"y", 0.9}}}}}});
        pump(*session);
        assert(ctx.hasMapDef);
        assert(ctx.mapDef.id == "lanes-1" && !ctx.mapDef.isArena);
        assert(ctx.mapDef.width == 600 && ctx.mapDef.playerBase.y == 0.9);
        assert(ctx.currentArena == arenaBefore);
        assert(session->shouldMirror());

        // A malformed layout is dropped and the stored one stays.
        link->push("MapDef", json{{"Def", json{{"id", 9}}}});
        pump(*session);
        assert(session->dispatcher().droppedCount() == 1);
        assert(ctx.mapDef.id == "lanes-1");

        assert(session->leaveMatch());
        assert(!ctx.hasMapDef);
        assert(!session->shouldMirror());
        std::filesystem::remove_all(dir);
    }
    {
        // Dropped connections retry after the backoff and redo the handshake.
        const auto dir = freshDir("reconnect");
        ScriptedDialer script;
        auto first = std::make_shared<FakeLink>();
        auto second = std::make_shared<FakeLink>();
        script.succeedWith(first);
        auto session = makeSession(script, dir, TokenStatus::Valid);
        session->completeLogin(" Bea ", "fresh-token");
        CredentialStore store(dir);
        assert(store.loadToken() == "fresh-token");
        assert(store.loadUsername() == "Bea");
        assert(connect(*session));
        assert(first->sent[0].data["name"] == "Bea");

        first->closed = true;
        pump(*session);
        assert(session->connection().state() == Net::ConnectionState::Failed);
        assert(session->statusText().rfind("Connection failed: connection lost (retrying in ", 0) == 0);

        script.succeedWith(second);
        session->tick(1.0);
        assert(script.dials() == 1);
        session->tick(1.0);
        assert(connect(*session));
        assert(script.dials() == 2);
        assert(second->countSent("SetName") == 1);
        assert(second->countSent("GetFriends") == 1);

        session->logout();
        assert(!store.hasToken());
        assert(second->closed);
        assert(session->connection().state() == Net::ConnectionState::Idle);
        std::filesystem::remove_all(dir);
    }
    return 0;
}
