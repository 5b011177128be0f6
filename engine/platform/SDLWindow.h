// SDL2 window with a fixed logical size and the client's command keys.
#pragma once

#include <SDL.h>

#include "../input/InputState.h"
#include "Window.h"

namespace Engine {

class RenderDevice;

class SDLWindow final : public Window {
public:
    SDLWindow() = default;
    ~SDLWindow() override;

    SDLWindow(const SDLWindow&) = delete;
    SDLWindow& operator=(const SDLWindow&) = delete;

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, InputState& input) override;
    bool isOpen() const override { return isOpen_; }

    // Esc pauses, F5 restarts, F10 surrenders, L leaves; everything else is ignored.
    static bool translateKey(SDL_Keycode sym, InputKey& out);

private:
    // Held keys are dropped on focus loss so no key-up goes missing.
    static void releaseAll(InputState& input);

    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    bool sdlStarted_{false};
    bool isOpen_{false};
};

}  // namespace Engine
