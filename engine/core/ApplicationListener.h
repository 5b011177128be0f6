// Engine-level application lifecycle interface (engine-agnostic).
#pragma once

#include <string>

namespace Engine {

class Application;
struct TimeStep;
class InputState;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    virtual bool onInitialize(Application& app) = 0;
    // Called once per rendered frame with the real (variable) frame time.
    virtual void onUpdate(const TimeStep& step, const InputState& input) = 0;
    // Runs before the loop stops; the listener may still talk to the network here.
    virtual void onQuitRequested(const std::string& /*reason*/) {}
    virtual void onShutdown() = 0;
};

}  // namespace Engine
