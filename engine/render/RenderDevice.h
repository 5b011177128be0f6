// Minimal immediate-mode 2D render device.
#pragma once

#include <memory>

#include "../math/Vec2.h"
#include "Color.h"

namespace Engine {

class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    virtual void clear(const Color& color) = 0;
    virtual void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) = 0;
    // Outline only; default falls back to four thin filled rects.
    virtual void drawRectOutline(const Vec2& topLeft, const Vec2& size, const Color& color) {
        drawFilledRect(topLeft, Vec2{size.x, 1.0f}, color);
        drawFilledRect(Vec2{topLeft.x, topLeft.y + size.y - 1.0f}, Vec2{size.x, 1.0f}, color);
        drawFilledRect(topLeft, Vec2{1.0f, size.y}, color);
        drawFilledRect(Vec2{topLeft.x + size.x - 1.0f, topLeft.y}, Vec2{1.0f, size.y}, color);
    }
    virtual void present() = 0;
};

using RenderDevicePtr = std::unique_ptr<RenderDevice>;

}  // namespace Engine
