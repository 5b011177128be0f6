#include "WorldPresenter.h"

#include <algorithm>
#include <string>

#include "../../engine/render/Color.h"
#include "../components/HpFx.h"
#include "../systems/EffectTracker.h"
#include "../world/WorldModel.h"

namespace Rumble {

namespace {
constexpr Engine::Color kBackground{28, 34, 30, 255};
constexpr Engine::Color kOwnColor{70, 140, 230, 255};
constexpr Engine::Color kEnemyColor{220, 70, 60, 255};
constexpr Engine::Color kBarBack{20, 20, 20, 200};
constexpr Engine::Color kBarHealth{60, 200, 80, 255};
constexpr Engine::Color kBarGhost{240, 200, 60, 255};
constexpr Engine::Color kBarHeal{150, 255, 170, 255};
constexpr Engine::Color kBarFlash{255, 255, 255, 255};
constexpr Engine::Color kPauseShade{0, 0, 0, 120};
constexpr float kUnitSize = 18.0f;
constexpr float kProjectileSize = 5.0f;

Engine::Color projectileColor(const std::string& type) {
    if (type == "fire") return Engine::Color{255, 120, 30, 255};
    if (type == "frost") return Engine::Color{140, 210, 255, 255};
    if (type == "lightning") return Engine::Color{250, 250, 120, 255};
    if (type == "holy") return Engine::Color{255, 240, 190, 255};
    if (type == "dark") return Engine::Color{120, 60, 160, 255};
    if (type == "nature") return Engine::Color{90, 200, 90, 255};
    if (type == "arcane") return Engine::Color{200, 110, 255, 255};
    return Engine::Color{230, 230, 230, 255};
}
}  // namespace

float WorldPresenter::viewY(float y, int64_t ownerId, const PresentOptions& options) const {
    if (options.mirror && ownerId == options.playerId) {
        return kScreenHeight - y;
    }
    return y;
}

void WorldPresenter::drawHealthBar(const Engine::Vec2& topLeft, float width, int hp, int maxHp, const HpFx* fx) {
    if (maxHp <= 0) {
        return;
    }
    const float barH = 3.0f;
    const auto frac = [maxHp](int v) { return std::clamp(static_cast<float>(v) / maxHp, 0.0f, 1.0f); };
    device_.drawFilledRect(topLeft, Engine::Vec2{width, barH}, kBarBack);
    if (fx && fx->ghostHp > hp) {
        const Engine::Color ghost = fx->blinkVisible(hp) ? kBarFlash : kBarGhost;
        device_.drawFilledRect(topLeft, Engine::Vec2{width * frac(fx->ghostHp), barH}, ghost);
    }
    const int solidHp = fx ? std::min(hp, fx->healGhostHp) : hp;
    if (fx && fx->healGhostHp < hp) {
        device_.drawFilledRect(topLeft, Engine::Vec2{width * frac(hp), barH}, kBarHeal);
    }
    device_.drawFilledRect(topLeft, Engine::Vec2{width * frac(solidHp), barH}, kBarHealth);
}

void WorldPresenter::draw(const WorldModel& world, const EffectTracker& effects, const PresentOptions& options) {
    device_.clear(kBackground);

    for (const auto& [owner, b] : world.bases()) {
        const bool own = owner == options.playerId;
        float top = static_cast<float>(b.y);
        if (options.mirror && own) {
            top = kScreenHeight - static_cast<float>(b.y + b.h);
        }
        const Engine::Vec2 topLeft{static_cast<float>(b.x), top};
        device_.drawFilledRect(topLeft, Engine::Vec2{static_cast<float>(b.w), static_cast<float>(b.h)},
                               own ? kOwnColor : kEnemyColor);
        drawHealthBar(Engine::Vec2{topLeft.x, topLeft.y - 6.0f}, static_cast<float>(b.w), b.hp, b.maxHp,
                      effects.base(owner));
    }

    for (const auto& [id, proj] : world.projectiles()) {
        const Engine::Vec2 pos{proj.pos.x - kProjectileSize / 2.0f,
                               viewY(proj.pos.y, proj.ownerId, options) - kProjectileSize / 2.0f};
        device_.drawFilledRect(pos, Engine::Vec2{kProjectileSize, kProjectileSize}, projectileColor(proj.type));
    }
    for (const auto& shot : world.inferredShots()) {
        const RenderUnit* shooter = world.unit(shot.shooterId);
        const int64_t owner = shooter ? shooter->ownerId : 0;
        const Engine::Vec2 mid = shot.origin + (shot.target - shot.origin) * 0.5f;
        device_.drawFilledRect(Engine::Vec2{mid.x - 2.0f, viewY(mid.y, owner, options) - 2.0f},
                               Engine::Vec2{4.0f, 4.0f}, projectileColor(shot.type));
    }

    for (const auto& [id, unit] : world.units()) {
        if (world.isSuppressed(id)) {
            continue;
        }
        const bool own = unit.ownerId == options.playerId;
        const Engine::Vec2 topLeft{unit.renderPos.x - kUnitSize / 2.0f,
                                   viewY(unit.renderPos.y, unit.ownerId, options) - kUnitSize / 2.0f};
        device_.drawFilledRect(topLeft, Engine::Vec2{kUnitSize, kUnitSize}, own ? kOwnColor : kEnemyColor);
        drawHealthBar(Engine::Vec2{topLeft.x, topLeft.y - 5.0f}, kUnitSize, unit.hp, unit.maxHp, effects.unit(id));
    }

    for (const auto& anim : world.spawnAnimations()) {
        if (!anim.active) {
            continue;
        }
        const RenderUnit* unit = world.unit(anim.unitId);
        const int64_t owner = unit ? unit->ownerId : options.playerId;
        const float size = kUnitSize * anim.currentScale;
        const Engine::Vec2 topLeft{anim.currentPos.x - size / 2.0f, viewY(anim.currentPos.y, owner, options) - size / 2.0f};
        // Fades to half opacity as the drop lands.
        const auto alpha = static_cast<unsigned char>(255.0f * (1.0f - 0.5f * anim.progress));
        device_.drawRectOutline(topLeft, Engine::Vec2{size, size},
                                Engine::withAlpha(owner == options.playerId ? kOwnColor : kEnemyColor, alpha));
    }

    if (options.paused) {
        device_.drawFilledRect(Engine::Vec2{0.0f, 0.0f}, Engine::Vec2{kScreenWidth, kScreenHeight}, kPauseShade);
    }
}

}  // namespace Rumble
