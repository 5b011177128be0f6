// Frame loop: polls the window, hands real frame time to the listener and paces to the tick rate.
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "ApplicationListener.h"
#include "Time.h"
#include "../input/InputState.h"
#include "../platform/Window.h"
#include "../render/RenderDevice.h"

namespace Engine {

class Application {
public:
    // Frames slower than this many tick budgets are counted and logged.
    static constexpr double kSlowFrameBudgets = 4.0;

    Application(ApplicationListener& listener, WindowPtr window, WindowConfig config = {});
    ~Application();

    bool initialize();
    // Returns the process exit code: 0 after a clean quit, 1 if never initialized.
    int run();
    void requestQuit(const std::string& reason);
    bool running() const { return running_; }

    uint64_t frameCount() const { return frames_; }
    uint64_t slowFrameCount() const { return slowFrames_; }
    const std::string& quitReason() const { return quitReason_; }

    RenderDevice& renderer() { return *renderDevice_; }

private:
    double frameBudget() const;
    void endFrame(double frameCost);

    ApplicationListener& listener_;
    WindowPtr window_;
    WindowConfig config_;
    bool running_{false};
    bool initialized_{false};
    TimeStep timeStep_{};
    InputState input_{};
    RenderDevicePtr renderDevice_;
    uint64_t frames_{0};
    uint64_t slowFrames_{0};
    std::string quitReason_;
};

}  // namespace Engine
