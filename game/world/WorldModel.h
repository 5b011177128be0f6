// Client-side mirror of the match: units, bases, projectiles and spawn animations keyed by server id.
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../engine/math/Vec2.h"
#include "../components/RenderProjectile.h"
#include "../components/RenderUnit.h"
#include "../components/SpawnAnimation.h"
#include "../net/NetMessages.h"

namespace Rumble {

constexpr float kScreenWidth = 600.0f;
constexpr float kScreenHeight = 1000.0f;

enum class MatchOutcome { Ongoing, Victory, Defeat, Draw };

const char* toString(MatchOutcome outcome);

class WorldModel {
public:
    static constexpr float kLerpRate = 10.0f;
    static constexpr float kSnapDistance = 0.01f;
    static constexpr float kProjectileSpeed = 400.0f;
    static constexpr float kProjectileHitDistance = 5.0f;
    static constexpr float kMinShotDistance = 10.0f;
    static constexpr float kSpawnDropHeight = 40.0f;

    // Rebuilds units and bases from scratch; rendered positions start at the server values.
    void applySnapshot(const Net::FullSnapshotMsg& snapshot);
    void applyDelta(const Net::StateDeltaMsg& delta);
    // One fixed simulation step.
    void step(float dt);
    void startSpawnAnimation(const Net::UnitSpawnEventMsg& event);
    void reset();

    bool isSuppressed(int64_t unitId) const;
    const SpawnAnimation* activeSpawnAnimation(int64_t unitId) const;
    // Nearest living enemy unit, else the first enemy base center, else the screen center.
    Engine::Vec2 findTargetFor(const RenderUnit& unit) const;

    // Exactly one own base, one other base, and a room id naming a PvP room.
    bool isPvpMatch(int64_t playerId, const std::string& roomId) const;
    // PvP with the player's base drawn in the top half.
    bool shouldMirror(int64_t playerId, const std::string& roomId) const;
    MatchOutcome matchOutcome(int64_t playerId, int timerRemainingSeconds) const;

    const std::unordered_map<int64_t, RenderUnit>& units() const { return units_; }
    const std::unordered_map<int64_t, Net::BaseState>& bases() const { return bases_; }
    const std::unordered_map<int64_t, RenderProjectile>& projectiles() const { return projectiles_; }
    const std::vector<SpawnAnimation>& spawnAnimations() const { return spawnAnimations_; }
    const std::vector<InferredShot>& inferredShots() const { return inferredShots_; }
    const RenderUnit* unit(int64_t id) const;
    const Net::BaseState* base(int64_t ownerId) const;
    bool empty() const;

private:
    void stepUnits(float dt);
    void stepProjectiles(float dt);
    void stepSpawnAnimations(float dt);
    void inferShots();

    std::unordered_map<int64_t, RenderUnit> units_;
    std::unordered_map<int64_t, Net::BaseState> bases_;
    std::unordered_map<int64_t, RenderProjectile> projectiles_;
    std::vector<SpawnAnimation> spawnAnimations_;
    std::vector<InferredShot> inferredShots_;
};

// Picks the projectile look from the shooter's name.
std::string projectileTypeForName(const std::string& unitName);

}  // namespace Rumble
