#include "SDLRenderDevice.h"

#include <SDL.h>

namespace Engine {

namespace {

SDL_Rect toRect(const Vec2& topLeft, const Vec2& size) {
    SDL_Rect rect{};
    rect.x = static_cast<int>(topLeft.x);
    rect.y = static_cast<int>(topLeft.y);
    rect.w = static_cast<int>(size.x);
    rect.h = static_cast<int>(size.y);
    return rect;
}

}  // namespace

SDLRenderDevice::SDLRenderDevice(SDL_Renderer* renderer) : renderer_(renderer) {}

void SDLRenderDevice::clear(const Color& color) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderClear(renderer_);
}

void SDLRenderDevice::drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) {
    const SDL_Rect rect = toRect(topLeft, size);
    SDL_BlendMode prev;
    SDL_GetRenderDrawBlendMode(renderer_, &prev);
    if (color.a < 255) {
        SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    }
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderFillRect(renderer_, &rect);
    SDL_SetRenderDrawBlendMode(renderer_, prev);
}

void SDLRenderDevice::drawRectOutline(const Vec2& topLeft, const Vec2& size, const Color& color) {
    const SDL_Rect rect = toRect(topLeft, size);
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderDrawRect(renderer_, &rect);
}

void SDLRenderDevice::present() { SDL_RenderPresent(renderer_); }

}  // namespace Engine
