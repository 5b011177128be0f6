#include "SDLWindow.h"

#include <SDL.h>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../input/InputState.h"
#include "SDLRenderDevice.h"

namespace Engine {

bool SDLWindow::translateKey(SDL_Keycode sym, InputKey& out) {
    switch (sym) {
        case SDLK_ESCAPE:
            out = InputKey::Pause;
            return true;
        case SDLK_F5:
            out = InputKey::Restart;
            return true;
        case SDLK_F10:
            out = InputKey::Surrender;
            return true;
        case SDLK_l:
            out = InputKey::Leave;
            return true;
        default:
            return false;
    }
}

void SDLWindow::releaseAll(InputState& input) {
    for (int i = 0; i < static_cast<int>(InputKey::Count); ++i) {
        input.setKeyDown(static_cast<InputKey>(i), false);
    }
}

SDLWindow::~SDLWindow() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
    }
    if (window_) {
        SDL_DestroyWindow(window_);
    }
    if (sdlStarted_) {
        SDL_Quit();
    }
}

bool SDLWindow::initialize(const WindowConfig& config) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdlStarted_ = true;

    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               config.width, config.height, SDL_WINDOW_SHOWN);
    if (!window_) {
        logError(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }

    const auto rendererFlags = config.vsync ? SDL_RENDERER_PRESENTVSYNC : 0;
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | rendererFlags);
    if (!renderer_) {
        logError(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }
    // World coordinates are fixed at the configured size regardless of the real window.
    SDL_RenderSetLogicalSize(renderer_, config.width, config.height);

    isOpen_ = true;
    logInfo("SDLWindow initialized.");
    return true;
}

std::unique_ptr<RenderDevice> SDLWindow::createRenderDevice() {
    if (!renderer_) {
        return nullptr;
    }
    return std::make_unique<SDLRenderDevice>(renderer_);
}

void SDLWindow::pollEvents(Application& app, InputState& input) {
    SDL_Event evt;
    InputKey key{};
    while (SDL_PollEvent(&evt)) {
        switch (evt.type) {
            case SDL_QUIT:
                app.requestQuit("Window close requested.");
                isOpen_ = false;
                break;
            case SDL_KEYDOWN:
                if (evt.key.repeat == 0 && translateKey(evt.key.keysym.sym, key)) {
                    input.setKeyDown(key, true);
                }
                break;
            case SDL_KEYUP:
                if (translateKey(evt.key.keysym.sym, key)) {
                    input.setKeyDown(key, false);
                }
                break;
            case SDL_WINDOWEVENT:
                if (evt.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
                    releaseAll(input);
                }
                break;
            default:
                break;
        }
    }
}

}  // namespace Engine
