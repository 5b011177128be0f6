#include "EffectTracker.h"

#include <algorithm>

#include "../world/WorldModel.h"

namespace Rumble {

namespace {

int lerpHp(int from, int to, int64_t startMs, int64_t durMs, int64_t nowMs) {
    if (durMs <= 0 || nowMs >= startMs + durMs) {
        return to;
    }
    if (nowMs <= startMs) {
        return from;
    }
    const double t = static_cast<double>(nowMs - startMs) / static_cast<double>(durMs);
    return from + static_cast<int>(static_cast<double>(to - from) * t);
}

}  // namespace

HpFx stepHpFx(HpFx fx, int currentHp, int64_t nowMs) {
    if (!fx.initialized) {
        fx.initialized = true;
        fx.lastHp = currentHp;
        fx.ghostHp = currentHp;
        fx.healGhostHp = currentHp;
        fx.lastUpdateMs = nowMs;
        return fx;
    }

    const bool advanced = nowMs > fx.lastUpdateMs;
    if (currentHp < fx.lastHp) {
        fx.ghostHp = std::max(fx.ghostHp, fx.lastHp);
        fx.holdUntilMs = nowMs + kGhostHoldMs;
        fx.lerpStartMs = fx.holdUntilMs;
        fx.lerpStartHp = fx.ghostHp;
        fx.lerpDurMs = kGhostLerpMs;
        fx.healGhostHp = currentHp;
        fx.flashTicks = kHitFlashTicks;
    } else if (currentHp > fx.lastHp) {
        fx.healGhostHp = std::min(fx.healGhostHp, fx.lastHp);
        fx.healHoldUntilMs = nowMs + kGhostHoldMs;
        fx.healLerpStartMs = fx.healHoldUntilMs;
        fx.healLerpStartHp = fx.healGhostHp;
        fx.healLerpDurMs = kGhostLerpMs;
        fx.ghostHp = currentHp;
    } else if (advanced && fx.flashTicks > 0) {
        --fx.flashTicks;
    }
    fx.lastHp = currentHp;

    if (fx.ghostHp <= currentHp) {
        fx.ghostHp = currentHp;
    } else if (nowMs >= fx.holdUntilMs) {
        const int target = lerpHp(fx.lerpStartHp, currentHp, fx.lerpStartMs, fx.lerpDurMs, nowMs);
        fx.ghostHp = std::max(currentHp, std::min(fx.ghostHp, target));
    }

    if (fx.healGhostHp >= currentHp) {
        fx.healGhostHp = currentHp;
    } else if (nowMs >= fx.healHoldUntilMs) {
        const int target = lerpHp(fx.healLerpStartHp, currentHp, fx.healLerpStartMs, fx.healLerpDurMs, nowMs);
        fx.healGhostHp = std::min(currentHp, std::max(fx.healGhostHp, target));
    }

    if (advanced) {
        fx.lastUpdateMs = nowMs;
    }
    return fx;
}

const HpFx& EffectTracker::stepUnit(int64_t unitId, int hp, int64_t nowMs) {
    HpFx& fx = units_[unitId];
    fx = stepHpFx(fx, hp, nowMs);
    return fx;
}

const HpFx& EffectTracker::stepBase(int64_t ownerId, int hp, int64_t nowMs) {
    HpFx& fx = bases_[ownerId];
    fx = stepHpFx(fx, hp, nowMs);
    return fx;
}

void EffectTracker::update(const WorldModel& world, int64_t nowMs) {
    for (const auto& [id, unit] : world.units()) {
        stepUnit(id, unit.hp, nowMs);
    }
    for (const auto& [owner, b] : world.bases()) {
        stepBase(owner, b.hp, nowMs);
    }
    prune(world);
}

void EffectTracker::prune(const WorldModel& world) {
    for (auto it = units_.begin(); it != units_.end();) {
        it = world.unit(it->first) ? std::next(it) : units_.erase(it);
    }
    for (auto it = bases_.begin(); it != bases_.end();) {
        it = world.base(it->first) ? std::next(it) : bases_.erase(it);
    }
}

void EffectTracker::clear() {
    units_.clear();
    bases_.clear();
}

const HpFx* EffectTracker::unit(int64_t unitId) const {
    auto it = units_.find(unitId);
    return it == units_.end() ? nullptr : &it->second;
}

const HpFx* EffectTracker::base(int64_t ownerId) const {
    auto it = bases_.find(ownerId);
    return it == bases_.end() ? nullptr : &it->second;
}

}  // namespace Rumble
