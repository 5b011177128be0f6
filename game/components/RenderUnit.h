// Server-owned unit plus the locally smoothed position used for drawing.
#pragma once

#include <cstdint>
#include <string>

#include "../../engine/math/Vec2.h"

namespace Rumble {

struct RenderUnit {
    int64_t id{0};
    std::string name;
    std::string unitClass;
    int64_t ownerId{0};

    Engine::Vec2 serverPos{};  // last authoritative position
    Engine::Vec2 renderPos{};
    Engine::Vec2 targetPos{};
    Engine::Vec2 prevPos{};

    int hp{0};
    int maxHp{0};
    int range{0};
    float facing{0.0f};
    std::string particle;
};

}  // namespace Rumble
