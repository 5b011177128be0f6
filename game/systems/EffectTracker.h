// Health ghost bars and hit flash for every unit and base in the world.
#pragma once

#include <cstdint>
#include <unordered_map>

#include "../components/HpFx.h"

namespace Rumble {

class WorldModel;

constexpr int64_t kGhostHoldMs = 500;
constexpr int64_t kGhostLerpMs = 300;
constexpr int kHitFlashTicks = 22;

// Pure: same inputs always give the same result.
HpFx stepHpFx(HpFx fx, int currentHp, int64_t nowMs);

class EffectTracker {
public:
    const HpFx& stepUnit(int64_t unitId, int hp, int64_t nowMs);
    const HpFx& stepBase(int64_t ownerId, int hp, int64_t nowMs);
    // Steps every entity in the world, then drops entries for entities that no longer exist.
    void update(const WorldModel& world, int64_t nowMs);
    void prune(const WorldModel& world);
    void clear();

    const HpFx* unit(int64_t unitId) const;
    const HpFx* base(int64_t ownerId) const;
    std::size_t size() const { return units_.size() + bases_.size(); }

private:
    std::unordered_map<int64_t, HpFx> units_;
    std::unordered_map<int64_t, HpFx> bases_;
};

}  // namespace Rumble
