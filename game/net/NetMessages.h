// Message definitions for client/server traffic.
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace Rumble::Net {

// Wire names of every message type the client sends or handles.
namespace MessageType {
// client -> server
constexpr char SetName[] = "SetName";
constexpr char GetProfile[] = "GetProfile";
constexpr char ListMinis[] = "ListMinis";
constexpr char ListMaps[] = "ListMaps";
constexpr char GetGuild[] = "GetGuild";
constexpr char GetFriends[] = "GetFriends";
constexpr char PauseGame[] = "PauseGame";
constexpr char ResumeGame[] = "ResumeGame";
constexpr char RestartMatch[] = "RestartMatch";
constexpr char SurrenderMatch[] = "SurrenderMatch";
constexpr char LeaveRoom[] = "LeaveRoom";
// server -> client
constexpr char Profile[] = "Profile";
constexpr char Minis[] = "Minis";
constexpr char Maps[] = "Maps";
constexpr char Init[] = "Init";
constexpr char HandUpdate[] = "HandUpdate";
constexpr char StateDelta[] = "StateDelta";
constexpr char FullSnapshot[] = "FullSnapshot";
constexpr char UnitSpawnEvent[] = "UnitSpawnEvent";
constexpr char TimerUpdate[] = "TimerUpdate";
constexpr char GameOver[] = "GameOver";
constexpr char RoomCreated[] = "RoomCreated";
constexpr char Error[] = "Error";
constexpr char LoggedOut[] = "LoggedOut";
constexpr char GoldSynced[] = "GoldSynced";
constexpr char VictoryEvent[] = "VictoryEvent";
constexpr char DefeatEvent[] = "DefeatEvent";
constexpr char RatingUpdate[] = "RatingUpdate";
constexpr char MapDef[] = "MapDef";
}  // namespace MessageType

// Missing keys keep their defaults; a present key of the wrong JSON type throws
// nlohmann::json::type_error, which the dispatcher reports.
template <typename T>
void readField(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

struct SetNameMsg {
    std::string name{"Player"};

    void serialize(nlohmann::json& j) const { j["name"] = name; }
};

struct ProfileMsg {
    int64_t playerId{0};
    std::string name;
    std::vector<std::string> army;
    int64_t gold{0};
    int accountXp{0};
    int pvpRating{0};
    std::string pvpRank;
    std::string avatar;
    std::map<std::string, int> unitXp;

    void deserialize(const nlohmann::json& j) {
        readField(j, "playerId", playerId);
        readField(j, "name", name);
        readField(j, "army", army);
        readField(j, "gold", gold);
        readField(j, "accountXp", accountXp);
        readField(j, "pvp_rating", pvpRating);
        readField(j, "pvp_rank", pvpRank);
        readField(j, "avatar", avatar);
        readField(j, "unitXp", unitXp);
    }
};

struct MiniInfo {
    std::string name;
    std::string unitClass;
    std::string subClass;
    std::string role;
    int cost{0};
    std::string portrait;
    int dmg{0};
    int hp{0};
    int speed{0};
    double attackSpeed{0.0};

    void deserialize(const nlohmann::json& j) {
        readField(j, "name", name);
        readField(j, "class", unitClass);
        readField(j, "subclass", subClass);
        readField(j, "role", role);
        readField(j, "cost", cost);
        readField(j, "portrait", portrait);
        readField(j, "dmg", dmg);
        readField(j, "hp", hp);
        readField(j, "speed", speed);
        readField(j, "attack_speed", attackSpeed);
    }
};

struct MinisMsg {
    std::vector<MiniInfo> items;

    void deserialize(const nlohmann::json& j) {
        items.clear();
        if (auto it = j.find("items"); it != j.end() && it->is_array()) {
            for (const auto& entry : *it) {
                MiniInfo info;
                info.deserialize(entry);
                items.push_back(std::move(info));
            }
        }
    }
};

struct MapInfo {
    std::string id;
    std::string name;
    std::string desc;

    void deserialize(const nlohmann::json& j) {
        readField(j, "id", id);
        readField(j, "name", name);
        readField(j, "desc", desc);
    }
};

struct MapsMsg {
    std::vector<MapInfo> items;

    void deserialize(const nlohmann::json& j) {
        items.clear();
        if (auto it = j.find("items"); it != j.end() && it->is_array()) {
            for (const auto& entry : *it) {
                MapInfo info;
                info.deserialize(entry);
                items.push_back(std::move(info));
            }
        }
    }
};

struct MiniCardView {
    std::string name;
    std::string portrait;
    int cost{0};
    std::string unitClass;

    void deserialize(const nlohmann::json& j) {
        readField(j, "name", name);
        readField(j, "portrait", portrait);
        readField(j, "cost", cost);
        readField(j, "class", unitClass);
    }
};

inline std::vector<MiniCardView> readHand(const nlohmann::json& j) {
    std::vector<MiniCardView> hand;
    if (auto it = j.find("hand"); it != j.end() && it->is_array()) {
        for (const auto& entry : *it) {
            MiniCardView card;
            card.deserialize(entry);
            hand.push_back(std::move(card));
        }
    }
    return hand;
}

struct InitMsg {
    int64_t playerId{0};
    int mapWidth{0};
    int mapHeight{0};
    std::vector<MiniCardView> hand;
    MiniCardView next;
    int64_t tick{0};
    std::string opponentAvatar;

    void deserialize(const nlohmann::json& j) {
        readField(j, "playerId", playerId);
        readField(j, "mapWidth", mapWidth);
        readField(j, "mapHeight", mapHeight);
        hand = readHand(j);
        if (auto it = j.find("next"); it != j.end() && it->is_object()) {
            next.deserialize(*it);
        }
        readField(j, "tick", tick);
        readField(j, "opponentAvatar", opponentAvatar);
    }
};

struct HandUpdateMsg {
    std::vector<MiniCardView> hand;
    MiniCardView next;

    void deserialize(const nlohmann::json& j) {
        hand = readHand(j);
        if (auto it = j.find("next"); it != j.end() && it->is_object()) {
            next.deserialize(*it);
        }
    }
};

struct UnitState {
    int64_t id{0};
    std::string name;
    double x{0.0};
    double y{0.0};
    int hp{0};
    int maxHp{0};
    int64_t ownerId{0};
    double facing{0.0};
    std::string unitClass;
    int range{0};
    std::string particle;

    void deserialize(const nlohmann::json& j) {
        readField(j, "id", id);
        readField(j, "name", name);
        readField(j, "x", x);
        readField(j, "y", y);
        readField(j, "hp", hp);
        readField(j, "maxHp", maxHp);
        readField(j, "ownerId", ownerId);
        readField(j, "facing", facing);
        readField(j, "class", unitClass);
        readField(j, "range", range);
        readField(j, "particle", particle);
    }
};

struct ProjectileState {
    int64_t id{0};
    double x{0.0};
    double y{0.0};
    double tx{0.0};
    double ty{0.0};
    int damage{0};
    int64_t ownerId{0};
    int64_t targetId{0};
    std::string projectileType;
    bool active{false};

    void deserialize(const nlohmann::json& j) {
        readField(j, "id", id);
        readField(j, "x", x);
        readField(j, "y", y);
        readField(j, "tx", tx);
        readField(j, "ty", ty);
        readField(j, "damage", damage);
        readField(j, "ownerId", ownerId);
        readField(j, "targetId", targetId);
        readField(j, "projectileType", projectileType);
        readField(j, "active", active);
    }
};

struct BaseState {
    int64_t ownerId{0};
    int hp{0};
    int maxHp{0};
    int x{0};
    int y{0};
    int w{0};
    int h{0};

    void deserialize(const nlohmann::json& j) {
        readField(j, "ownerId", ownerId);
        readField(j, "hp", hp);
        readField(j, "maxHp", maxHp);
        readField(j, "x", x);
        readField(j, "y", y);
        readField(j, "w", w);
        readField(j, "h", h);
    }
};

template <typename T>
std::vector<T> readList(const nlohmann::json& j, const char* key) {
    std::vector<T> out;
    if (auto it = j.find(key); it != j.end() && it->is_array()) {
        out.reserve(it->size());
        for (const auto& entry : *it) {
            T item;
            item.deserialize(entry);
            out.push_back(std::move(item));
        }
    }
    return out;
}

struct StateDeltaMsg {
    int64_t tick{0};
    std::vector<UnitState> unitsUpsert;
    std::vector<int64_t> unitsRemoved;
    std::vector<ProjectileState> projectiles;
    std::vector<BaseState> bases;

    void deserialize(const nlohmann::json& j) {
        readField(j, "tick", tick);
        unitsUpsert = readList<UnitState>(j, "unitsUpsert");
        unitsRemoved.clear();
        readField(j, "unitsRemoved", unitsRemoved);
        projectiles = readList<ProjectileState>(j, "projectiles");
        bases = readList<BaseState>(j, "bases");
    }
};

struct FullSnapshotMsg {
    int64_t tick{0};
    std::vector<UnitState> units;
    std::vector<BaseState> bases;

    void deserialize(const nlohmann::json& j) {
        readField(j, "tick", tick);
        units = readList<UnitState>(j, "units");
        bases = readList<BaseState>(j, "bases");
    }
};

struct UnitSpawnEventMsg {
    int64_t unitId{0};
    double unitX{0.0};
    double unitY{0.0};
    std::string unitName;
    std::string unitClass;
    std::string unitSubclass;
    int64_t ownerId{0};

    void deserialize(const nlohmann::json& j) {
        readField(j, "unitId", unitId);
        readField(j, "unitX", unitX);
        readField(j, "unitY", unitY);
        readField(j, "unitName", unitName);
        readField(j, "unitClass", unitClass);
        readField(j, "unitSubclass", unitSubclass);
        readField(j, "ownerId", ownerId);
    }
};

struct TimerUpdateMsg {
    int remainingSeconds{0};
    bool isPaused{false};

    void deserialize(const nlohmann::json& j) {
        readField(j, "remainingSeconds", remainingSeconds);
        readField(j, "isPaused", isPaused);
    }
};

struct GameOverMsg {
    int64_t winnerId{0};
    std::string reason;

    void deserialize(const nlohmann::json& j) {
        readField(j, "winner_id", winnerId);
        readField(j, "reason", reason);
    }
};

struct RoomCreatedMsg {
    std::string roomId;

    void deserialize(const nlohmann::json& j) { readField(j, "roomId", roomId); }
};

struct ErrorMsg {
    std::string code;
    std::string message;

    void deserialize(const nlohmann::json& j) {
        readField(j, "code", code);
        readField(j, "message", message);
    }
};

struct GoldSyncedMsg {
    int64_t gold{0};

    void deserialize(const nlohmann::json& j) { readField(j, "gold", gold); }
};

struct VictoryEventMsg {
    int64_t winnerId{0};
    std::string winnerName;
    std::string matchType;
    int duration{0};
    int goldEarned{0};
    int xpGained{0};

    void deserialize(const nlohmann::json& j) {
        readField(j, "winnerId", winnerId);
        readField(j, "winnerName", winnerName);
        readField(j, "matchType", matchType);
        readField(j, "duration", duration);
        readField(j, "goldEarned", goldEarned);
        readField(j, "xpGained", xpGained);
    }
};

struct DefeatEventMsg {
    int64_t loserId{0};
    std::string loserName;
    int64_t winnerId{0};
    std::string winnerName;
    std::string matchType;
    int duration{0};

    void deserialize(const nlohmann::json& j) {
        readField(j, "loserId", loserId);
        readField(j, "loserName", loserName);
        readField(j, "winnerId", winnerId);
        readField(j, "winnerName", winnerName);
        readField(j, "matchType", matchType);
        readField(j, "duration", duration);
    }
};

// match_type is "queue" for ranked games and "friendly" otherwise.
struct RatingUpdateMsg {
    std::string queueId;
    int newRating{0};
    int delta{0};
    std::string rank;
    std::string oppName;
    int oppRating{0};
    std::string matchType;

    void deserialize(const nlohmann::json& j) {
        readField(j, "queue_id", queueId);
        readField(j, "new_rating", newRating);
        readField(j, "delta", delta);
        readField(j, "rank", rank);
        readField(j, "opp_name", oppName);
        readField(j, "opp_rating", oppRating);
        readField(j, "match_type", matchType);
    }
};

// Normalized 0..1 map coordinates.
struct MapPoint {
    double x{0.0};
    double y{0.0};

    void deserialize(const nlohmann::json& j) {
        readField(j, "x", x);
        readField(j, "y", y);
    }
};

struct MapDefInfo {
    std::string id;
    std::string name;
    int width{0};
    int height{0};
    std::string bg;
    MapPoint playerBase;
    MapPoint enemyBase;
    int timeLimit{0};
    bool isArena{false};

    void deserialize(const nlohmann::json& j) {
        readField(j, "id", id);
        readField(j, "name", name);
        readField(j, "width", width);
        readField(j, "height", height);
        readField(j, "bg", bg);
        if (auto it = j.find("playerBase"); it != j.end() && it->is_object()) {
            playerBase.deserialize(*it);
        }
        if (auto it = j.find("enemyBase"); it != j.end() && it->is_object()) {
            enemyBase.deserialize(*it);
        }
        readField(j, "timeLimit", timeLimit);
        readField(j, "isArena", isArena);
    }
};

// The layout travels under a capitalized "Def" key.
struct MapDefMsg {
    MapDefInfo def;

    void deserialize(const nlohmann::json& j) {
        if (auto it = j.find("Def"); it != j.end() && it->is_object()) {
            def.deserialize(*it);
        }
    }
};

}  // namespace Rumble::Net
