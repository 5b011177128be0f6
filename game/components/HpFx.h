// Health bar feedback state: damage ghost, heal ghost and hit flash.
#pragma once

#include <cstdint>

namespace Rumble {

struct HpFx {
    bool initialized{false};
    int lastHp{0};

    // Damage ghost: >= current HP, drains down after a hold.
    int ghostHp{0};
    int64_t holdUntilMs{0};
    int64_t lerpStartMs{0};
    int lerpStartHp{0};
    int64_t lerpDurMs{300};

    // Heal ghost: <= current HP, rises after a hold.
    int healGhostHp{0};
    int64_t healHoldUntilMs{0};
    int64_t healLerpStartMs{0};
    int healLerpStartHp{0};
    int64_t healLerpDurMs{300};

    int flashTicks{0};
    int64_t lastUpdateMs{0};

    // Blink cue: visible while the flash runs and the damage ghost has not caught up.
    bool blinkVisible(int currentHp) const {
        return flashTicks > 0 && ghostHp != currentHp && (flashTicks % 6) < 3;
    }
};

}  // namespace Rumble
