#include "ClientApp.h"

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/core/Time.h"
#include "../engine/input/InputState.h"

namespace Rumble {

ClientApp::ClientApp(std::unique_ptr<ClientSession> session) : session_(std::move(session)) {}

bool ClientApp::onInitialize(Engine::Application& app) {
    if (!session_) {
        Engine::logError("ClientApp requires a session.");
        return false;
    }
    app_ = &app;
    presenter_ = std::make_unique<WorldPresenter>(app.renderer());
    Engine::logInfo("Rumble client starting as " + session_->context().playerName + " on " +
                    session_->context().platform + ".");
    session_->start();
    reportStatus();
    return true;
}

void ClientApp::handleInput(const Engine::InputState& input) {
    using Engine::InputKey;
    if (input.wasPressed(InputKey::Pause)) {
        session_->togglePause();
    }
    if (input.wasPressed(InputKey::Surrender)) {
        session_->surrenderMatch();
    }
    if (input.wasPressed(InputKey::Restart)) {
        session_->restartMatch();
    }
    if (input.wasPressed(InputKey::Leave)) {
        session_->leaveMatch();
    }
}

void ClientApp::onUpdate(const Engine::TimeStep& step, const Engine::InputState& input) {
    handleInput(input);
    session_->tick(step.deltaSeconds);
    reportStatus();

    PresentOptions options;
    options.playerId = session_->context().playerId;
    options.mirror = session_->shouldMirror();
    options.paused = session_->clock().paused();
    presenter_->draw(session_->world(), session_->effects(), options);
}

void ClientApp::reportStatus() {
    const std::string status = session_->statusText();
    if (status != lastStatus_) {
        Engine::logInfo("Status: " + status);
        lastStatus_ = status;
    }
    const MatchOutcome outcome = session_->matchOutcome();
    if (outcome != lastOutcome_) {
        if (outcome != MatchOutcome::Ongoing) {
            Engine::logInfo(std::string("Match result: ") + toString(outcome));
        }
        lastOutcome_ = outcome;
    }
}

void ClientApp::onQuitRequested(const std::string& /*reason*/) {
    if (session_ && session_->context().inBattle) {
        session_->leaveMatch();
    }
}

void ClientApp::onShutdown() {
    if (session_) {
        session_->connection().reset();
    }
    Engine::logInfo("Rumble client shut down.");
}

}  // namespace Rumble
