// Application listener: maps input to session commands, ticks the session and draws the world.
#pragma once

#include <memory>
#include <string>

#include "../engine/core/ApplicationListener.h"
#include "ClientSession.h"
#include "render/WorldPresenter.h"

namespace Engine {
class Application;
}

namespace Rumble {

class ClientApp final : public Engine::ApplicationListener {
public:
    explicit ClientApp(std::unique_ptr<ClientSession> session);

    bool onInitialize(Engine::Application& app) override;
    void onUpdate(const Engine::TimeStep& step, const Engine::InputState& input) override;
    void onQuitRequested(const std::string& reason) override;
    void onShutdown() override;

    ClientSession& session() { return *session_; }

private:
    void handleInput(const Engine::InputState& input);
    void reportStatus();

    std::unique_ptr<ClientSession> session_;
    std::unique_ptr<WorldPresenter> presenter_;
    Engine::Application* app_{nullptr};
    std::string lastStatus_;
    MatchOutcome lastOutcome_{MatchOutcome::Ongoing};
};

}  // namespace Rumble
