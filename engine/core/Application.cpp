#include "Application.h"

#include <chrono>
#include <thread>

#include "Logger.h"

namespace Engine {

Application::Application(ApplicationListener& listener, WindowPtr window, WindowConfig config)
    : listener_(listener), window_(std::move(window)), config_(std::move(config)) {}

Application::~Application() {
    if (initialized_) {
        listener_.onShutdown();
    }
}

bool Application::initialize() {
    if (!window_) {
        logError("Application requires a Window instance.");
        return false;
    }

    if (!window_->initialize(config_)) {
        logError("Failed to initialize window.");
        return false;
    }

    renderDevice_ = window_->createRenderDevice();
    if (!renderDevice_) {
        logError("Failed to create render device.");
        return false;
    }

    initialized_ = true;
    running_ = listener_.onInitialize(*this);
    return running_;
}

double Application::frameBudget() const {
    return config_.tickRate > 0 ? 1.0 / config_.tickRate : kFixedTickSeconds;
}

int Application::run() {
    if (!running_) {
        logError("Application::run called without a successful initialize().");
        return 1;
    }

    using clock = std::chrono::steady_clock;
    auto last = clock::now();
    while (running_ && window_->isOpen()) {
        const auto frameStart = clock::now();
        timeStep_.deltaSeconds = std::chrono::duration<double>(frameStart - last).count();
        timeStep_.elapsedSeconds += timeStep_.deltaSeconds;
        last = frameStart;

        window_->pollEvents(*this, input_);
        listener_.onUpdate(timeStep_, input_);
        input_.nextFrame();
        renderDevice_->present();
        ++frames_;

        endFrame(std::chrono::duration<double>(clock::now() - frameStart).count());
    }

    std::string summary = "Application loop exited after " + std::to_string(frames_) + " frames";
    if (slowFrames_ > 0) {
        summary += " (" + std::to_string(slowFrames_) + " slow)";
    }
    logInfo(summary + ".");
    return 0;
}

void Application::endFrame(double frameCost) {
    const double budget = frameBudget();
    if (frameCost < budget) {
        std::this_thread::sleep_for(std::chrono::duration<double>(budget - frameCost));
        return;
    }
    if (frameCost > budget * kSlowFrameBudgets) {
        ++slowFrames_;
        logDebug("Frame " + std::to_string(frames_) + " took " +
                 std::to_string(static_cast<int>(frameCost * 1000.0)) + " ms.");
    }
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    quitReason_ = reason;
    logInfo("Shutdown requested: " + reason);
    listener_.onQuitRequested(reason);
    running_ = false;
}

}  // namespace Engine
