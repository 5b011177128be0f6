// Server-streamed projectile moved locally toward its target point.
#pragma once

#include <cstdint>
#include <string>

#include "../../engine/math/Vec2.h"

namespace Rumble {

struct RenderProjectile {
    int64_t id{0};
    Engine::Vec2 pos{};
    Engine::Vec2 target{};
    int damage{0};
    int64_t ownerId{0};
    int64_t targetId{0};  // 0 when aimed at a base
    std::string type{"default"};
    bool active{true};
};

// Derived each tick for ranged units when the server streams no projectiles.
struct InferredShot {
    int64_t shooterId{0};
    Engine::Vec2 origin{};
    Engine::Vec2 target{};
    std::string type{"default"};
};

}  // namespace Rumble
