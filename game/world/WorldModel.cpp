#include "WorldModel.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <limits>

namespace Rumble {

namespace {

Engine::Vec2 toVec(double x, double y) { return Engine::Vec2{static_cast<float>(x), static_cast<float>(y)}; }

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Engine::Vec2 baseCenter(const Net::BaseState& b) {
    return Engine::Vec2{static_cast<float>(b.x + b.w / 2), static_cast<float>(b.y + b.h / 2)};
}

}  // namespace

const char* toString(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::Ongoing:
            return "ongoing";
        case MatchOutcome::Victory:
            return "victory";
        case MatchOutcome::Defeat:
            return "defeat";
        case MatchOutcome::Draw:
            return "draw";
    }
    return "ongoing";
}

std::string projectileTypeForName(const std::string& unitName) {
    const std::string name = lowercase(unitName);
    if (containsAny(name, {"blaze", "fire", "magma", "flame", "bloodmage"})) return "fire";
    if (containsAny(name, {"glacia", "blizzard", "frost", "ice", "arctic", "winter"})) return "frost";
    if (containsAny(name, {"lightning", "chain", "storm", "thunder"})) return "lightning";
    if (containsAny(name, {"holy", "light", "divine", "angel", "nova", "radiant"})) return "holy";
    if (containsAny(name, {"shadow", "dark", "night", "void", "death", "necro"})) return "dark";
    if (containsAny(name, {"spirit", "nature", "earth", "wind", "jungle", "forest"})) return "nature";
    if (containsAny(name, {"arcane", "mana", "magic", "sorcerer", "wizard", "mage"})) return "arcane";
    return "default";
}

void WorldModel::applySnapshot(const Net::FullSnapshotMsg& snapshot) {
    units_.clear();
    bases_.clear();
    projectiles_.clear();
    inferredShots_.clear();
    for (const auto& u : snapshot.units) {
        RenderUnit unit;
        unit.id = u.id;
        unit.name = u.name;
        unit.unitClass = u.unitClass;
        unit.ownerId = u.ownerId;
        unit.serverPos = toVec(u.x, u.y);
        unit.renderPos = unit.serverPos;
        unit.targetPos = unit.serverPos;
        unit.prevPos = unit.serverPos;
        unit.hp = u.hp;
        unit.maxHp = u.maxHp;
        unit.range = u.range;
        unit.facing = static_cast<float>(u.facing);
        unit.particle = u.particle;
        units_[u.id] = std::move(unit);
    }
    for (const auto& b : snapshot.bases) {
        bases_[b.ownerId] = b;
    }
}

void WorldModel::applyDelta(const Net::StateDeltaMsg& delta) {
    for (const auto& u : delta.unitsUpsert) {
        const Engine::Vec2 pos = toVec(u.x, u.y);
        auto it = units_.find(u.id);
        if (it == units_.end()) {
            // First sighting: place at the server position so it does not slide in.
            RenderUnit unit;
            unit.id = u.id;
            unit.name = u.name;
            unit.unitClass = u.unitClass;
            unit.ownerId = u.ownerId;
            unit.renderPos = pos;
            unit.prevPos = pos;
            it = units_.emplace(u.id, std::move(unit)).first;
        }
        RenderUnit& unit = it->second;
        unit.prevPos = unit.renderPos;
        unit.serverPos = pos;
        unit.targetPos = pos;
        unit.hp = u.hp;
        unit.maxHp = u.maxHp;
        unit.range = u.range;
        unit.facing = static_cast<float>(u.facing);
        unit.particle = u.particle;
    }
    for (int64_t id : delta.unitsRemoved) {
        units_.erase(id);
    }

    if (!delta.projectiles.empty()) {
        projectiles_.clear();
        for (const auto& p : delta.projectiles) {
            if (!p.active) {
                continue;
            }
            RenderProjectile proj;
            proj.id = p.id;
            proj.pos = toVec(p.x, p.y);
            proj.target = toVec(p.tx, p.ty);
            proj.damage = p.damage;
            proj.ownerId = p.ownerId;
            proj.targetId = p.targetId;
            proj.type = p.projectileType.empty() ? "default" : p.projectileType;
            proj.active = true;
            projectiles_[p.id] = std::move(proj);
        }
    }

    for (const auto& b : delta.bases) {
        bases_[b.ownerId] = b;
    }
}

void WorldModel::step(float dt) {
    if (dt <= 0.0f) {
        return;
    }
    stepSpawnAnimations(dt);
    stepUnits(dt);
    stepProjectiles(dt);
    inferShots();
}

void WorldModel::stepUnits(float dt) {
    const float alpha = std::min(1.0f, kLerpRate * dt);
    for (auto& [id, unit] : units_) {
        if (isSuppressed(id)) {
            continue;
        }
        const Engine::Vec2 remaining = unit.targetPos - unit.renderPos;
        if (remaining.length() <= kSnapDistance) {
            unit.renderPos = unit.targetPos;
            continue;
        }
        unit.renderPos += remaining * alpha;
        if (distance(unit.renderPos, unit.targetPos) <= kSnapDistance) {
            unit.renderPos = unit.targetPos;
        }
    }
}

void WorldModel::stepProjectiles(float dt) {
    const float stepLen = kProjectileSpeed * dt;
    for (auto it = projectiles_.begin(); it != projectiles_.end();) {
        RenderProjectile& proj = it->second;
        const Engine::Vec2 toTarget = proj.target - proj.pos;
        const float dist = toTarget.length();
        if (!proj.active || dist < kProjectileHitDistance) {
            it = projectiles_.erase(it);
            continue;
        }
        if (stepLen >= dist) {
            proj.pos = proj.target;
        } else {
            proj.pos += toTarget * (stepLen / dist);
        }
        ++it;
    }
}

void WorldModel::stepSpawnAnimations(float dt) {
    spawnAnimations_.erase(std::remove_if(spawnAnimations_.begin(), spawnAnimations_.end(),
                                          [](const SpawnAnimation& anim) { return !anim.active; }),
                           spawnAnimations_.end());
    for (auto& anim : spawnAnimations_) {
        anim.progress += anim.duration > 0.0f ? dt / anim.duration : 1.0f;
        if (anim.progress >= 1.0f) {
            anim.progress = 1.0f;
            anim.currentScale = anim.endScale;
            anim.currentPos = anim.targetPos;
            anim.active = false;
            continue;
        }
        const float inv = 1.0f - anim.progress;
        const float eased = 1.0f - inv * inv * inv;
        anim.currentScale = anim.startScale + (anim.endScale - anim.startScale) * eased;
        anim.currentPos = anim.startPos + (anim.targetPos - anim.startPos) * eased;
    }
}

void WorldModel::inferShots() {
    inferredShots_.clear();
    if (!projectiles_.empty()) {
        return;
    }
    for (const auto& [id, unit] : units_) {
        if (lowercase(unit.unitClass) != "range" || isSuppressed(id)) {
            continue;
        }
        const Engine::Vec2 target = findTargetFor(unit);
        const float dist = distance(unit.renderPos, target);
        if (dist > kMinShotDistance && dist <= static_cast<float>(unit.range)) {
            inferredShots_.push_back(InferredShot{id, unit.renderPos, target, projectileTypeForName(unit.name)});
        }
    }
}

void WorldModel::startSpawnAnimation(const Net::UnitSpawnEventMsg& event) {
    SpawnAnimation anim;
    anim.unitId = event.unitId;
    anim.unitName = event.unitName;
    anim.unitClass = event.unitClass;
    anim.unitSubclass = event.unitSubclass;
    anim.targetPos = toVec(event.unitX, event.unitY);
    anim.startPos = Engine::Vec2{anim.targetPos.x, anim.targetPos.y - kSpawnDropHeight};
    anim.currentPos = anim.startPos;
    anim.currentScale = anim.startScale;
    spawnAnimations_.push_back(std::move(anim));
}

void WorldModel::reset() {
    units_.clear();
    bases_.clear();
    projectiles_.clear();
    spawnAnimations_.clear();
    inferredShots_.clear();
}

bool WorldModel::isSuppressed(int64_t unitId) const { return activeSpawnAnimation(unitId) != nullptr; }

const SpawnAnimation* WorldModel::activeSpawnAnimation(int64_t unitId) const {
    for (const auto& anim : spawnAnimations_) {
        if (anim.unitId == unitId && anim.active) {
            return &anim;
        }
    }
    return nullptr;
}

Engine::Vec2 WorldModel::findTargetFor(const RenderUnit& unit) const {
    const RenderUnit* best = nullptr;
    float bestDist = std::numeric_limits<float>::max();
    for (const auto& [id, other] : units_) {
        if (other.ownerId == unit.ownerId || other.hp <= 0) {
            continue;
        }
        const float d = distance(other.renderPos, unit.renderPos);
        if (d < bestDist || (d == bestDist && best && other.id < best->id)) {
            bestDist = d;
            best = &other;
        }
    }
    if (best) {
        return best->renderPos;
    }
    // Lowest owner id keeps the choice stable across hash orderings.
    const Net::BaseState* enemyBase = nullptr;
    for (const auto& [owner, b] : bases_) {
        if (owner != unit.ownerId && (!enemyBase || owner < enemyBase->ownerId)) {
            enemyBase = &b;
        }
    }
    if (enemyBase) {
        return baseCenter(*enemyBase);
    }
    return Engine::Vec2{kScreenWidth / 2.0f, kScreenHeight / 2.0f};
}

bool WorldModel::isPvpMatch(int64_t playerId, const std::string& roomId) const {
    int own = 0;
    int other = 0;
    for (const auto& [owner, b] : bases_) {
        if (owner == playerId) {
            ++own;
        } else {
            ++other;
        }
    }
    return own == 1 && other == 1 && roomId.find("pvp-") != std::string::npos;
}

bool WorldModel::shouldMirror(int64_t playerId, const std::string& roomId) const {
    if (!isPvpMatch(playerId, roomId)) {
        return false;
    }
    const Net::BaseState* own = base(playerId);
    return own && static_cast<float>(own->y) < kScreenHeight / 2.0f;
}

MatchOutcome WorldModel::matchOutcome(int64_t playerId, int timerRemainingSeconds) const {
    const Net::BaseState* own = base(playerId);
    const Net::BaseState* enemy = nullptr;
    for (const auto& [owner, b] : bases_) {
        if (owner != playerId && (!enemy || owner < enemy->ownerId)) {
            enemy = &b;
        }
    }
    if (!own || !enemy) {
        return MatchOutcome::Ongoing;
    }
    if (own->hp <= 0 && enemy->hp <= 0) return MatchOutcome::Draw;
    if (own->hp <= 0) return MatchOutcome::Defeat;
    if (enemy->hp <= 0) return MatchOutcome::Victory;
    if (timerRemainingSeconds > 0) {
        return MatchOutcome::Ongoing;
    }
    // Time ran out: the healthier base (by fraction of max) wins.
    const double ownFrac = own->maxHp > 0 ? static_cast<double>(own->hp) / own->maxHp : 0.0;
    const double enemyFrac = enemy->maxHp > 0 ? static_cast<double>(enemy->hp) / enemy->maxHp : 0.0;
    if (ownFrac > enemyFrac) return MatchOutcome::Victory;
    if (ownFrac < enemyFrac) return MatchOutcome::Defeat;
    return MatchOutcome::Draw;
}

const RenderUnit* WorldModel::unit(int64_t id) const {
    auto it = units_.find(id);
    return it == units_.end() ? nullptr : &it->second;
}

const Net::BaseState* WorldModel::base(int64_t ownerId) const {
    auto it = bases_.find(ownerId);
    return it == bases_.end() ? nullptr : &it->second;
}

bool WorldModel::empty() const {
    return units_.empty() && bases_.empty() && projectiles_.empty() && spawnAnimations_.empty() &&
           inferredShots_.empty();
}

}  // namespace Rumble
