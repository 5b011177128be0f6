// Per-frame input snapshot: held keys plus keys pressed this frame.
#pragma once

#include <array>

namespace Engine {

enum class InputKey {
    Pause = 0,
    Restart,
    Surrender,
    Leave,
    Count
};

class InputState {
public:
    void setKeyDown(InputKey key, bool down) {
        const auto idx = static_cast<int>(key);
        if (down && !keys_[idx]) {
            pressed_[idx] = true;
        }
        keys_[idx] = down;
    }
    bool isDown(InputKey key) const { return keys_[static_cast<int>(key)]; }
    // True only on the frame the key went down.
    bool wasPressed(InputKey key) const { return pressed_[static_cast<int>(key)]; }

    void nextFrame() { pressed_.fill(false); }

private:
    std::array<bool, static_cast<int>(InputKey::Count)> keys_{};
    std::array<bool, static_cast<int>(InputKey::Count)> pressed_{};
};

}  // namespace Engine
