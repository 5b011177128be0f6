// Everything the session knows about the player, the catalog and the current match.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "net/NetMessages.h"

namespace Rumble {

constexpr int kDefaultMatchSeconds = 180;

struct SessionContext {
    std::string platform{"desktop"};
    std::string playerName{"Player"};
    std::string username;
    int64_t playerId{0};

    // Profile
    int64_t accountGold{0};
    int pvpRating{0};
    std::string pvpRank;
    std::string avatar;
    std::string pvpStatus;

    // Catalog
    std::vector<Net::MiniInfo> minis;
    std::vector<Net::MapInfo> maps;

    // Match
    std::string roomId;
    std::string currentArena;
    // Layout of the current match. Survives Init, which may arrive after it.
    Net::MapDefInfo mapDef;
    bool hasMapDef{false};
    std::string opponentAvatar;
    bool inBattle{false};
    bool gameOver{false};
    bool victory{false};
    std::string gameOverReason;
    int timerRemainingSeconds{0};
    double timerAccumulator{0.0};
    bool pauseOverlay{false};
    std::vector<Net::MiniCardView> hand;
    Net::MiniCardView next;

    std::string lastServerError;

    void clearMatch() {
        roomId.clear();
        opponentAvatar.clear();
        inBattle = false;
        gameOver = false;
        victory = false;
        gameOverReason.clear();
        timerRemainingSeconds = 0;
        timerAccumulator = 0.0;
        pauseOverlay = false;
        hand.clear();
        next = Net::MiniCardView{};
    }
};

}  // namespace Rumble
