// Draws the render-ready world as flat debug shapes through the engine RenderDevice.
#pragma once

#include <cstdint>

#include "../../engine/render/RenderDevice.h"

namespace Rumble {

class WorldModel;
class EffectTracker;
struct HpFx;

struct PresentOptions {
    int64_t playerId{0};
    bool mirror{false};
    bool paused{false};
};

class WorldPresenter {
public:
    explicit WorldPresenter(Engine::RenderDevice& device) : device_(device) {}

    void draw(const WorldModel& world, const EffectTracker& effects, const PresentOptions& options);

private:
    // Mirrors only the player's own entities so both sides see themselves at the bottom.
    float viewY(float y, int64_t ownerId, const PresentOptions& options) const;
    void drawHealthBar(const Engine::Vec2& topLeft, float width, int hp, int maxHp, const HpFx* fx);

    Engine::RenderDevice& device_;
};

}  // namespace Rumble
