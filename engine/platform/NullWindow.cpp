#include "NullWindow.h"

#include <string>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../render/NullRenderDevice.h"

namespace Engine {

bool NullWindow::initialize(const WindowConfig& config) {
    isOpen_ = true;
    frames_ = 0;
    logInfo("Headless mode: " + config.title + " running without a window.");
    if (frameLimit_ > 0) {
        logInfo("Headless frame limit: " + std::to_string(frameLimit_));
    }
    return true;
}

void NullWindow::pollEvents(Application& app, InputState& /*input*/) {
    if (frameLimit_ == 0 || !isOpen_) {
        return;
    }
    if (++frames_ >= frameLimit_) {
        isOpen_ = false;
        app.requestQuit("Headless frame limit reached.");
    }
}

std::unique_ptr<RenderDevice> NullWindow::createRenderDevice() { return std::make_unique<NullRenderDevice>(); }

}  // namespace Engine
