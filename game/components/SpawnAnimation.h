// Drop-in animation played when a unit is deployed.
#pragma once

#include <cstdint>
#include <string>

#include "../../engine/math/Vec2.h"

namespace Rumble {

struct SpawnAnimation {
    int64_t unitId{0};
    std::string unitName;
    std::string unitClass;
    std::string unitSubclass;
    Engine::Vec2 startPos{};
    Engine::Vec2 targetPos{};
    Engine::Vec2 currentPos{};
    float startScale{1.4f};
    float endScale{1.0f};
    float currentScale{1.4f};
    float progress{0.0f};
    float duration{0.4f};
    bool active{true};
};

}  // namespace Rumble
