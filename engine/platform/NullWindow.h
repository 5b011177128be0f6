// Headless window: keeps the loop alive without a display until a frame budget runs out.
#pragma once

#include <cstdint>

#include "Window.h"

namespace Engine {

class NullWindow final : public Window {
public:
    // frameLimit == 0 runs until the application asks to quit.
    explicit NullWindow(uint64_t frameLimit = 0) : frameLimit_(frameLimit) {}

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, class InputState& input) override;
    bool isOpen() const override { return isOpen_; }

private:
    bool isOpen_{false};
    uint64_t frameLimit_{0};
    uint64_t frames_{0};
};

}  // namespace Engine
