// Abstract window interface; real implementations live under /engine/platform.
#pragma once

#include <memory>
#include <string>

namespace Engine {

struct WindowConfig {
    int width{600};
    int height{1000};
    std::string title{"Rumble"};
    bool vsync{true};
    int tickRate{60};
};

class Application;

class Window {
public:
    virtual ~Window() = default;

    virtual bool initialize(const WindowConfig& config) = 0;
    virtual std::unique_ptr<class RenderDevice> createRenderDevice() = 0;
    virtual void pollEvents(Application& app, class InputState& input) = 0;
    virtual bool isOpen() const = 0;
};

using WindowPtr = std::unique_ptr<Window>;

}  // namespace Engine
