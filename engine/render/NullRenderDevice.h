// No-op renderer used by NullWindow and by tests that drive the presenter.
#pragma once

#include "RenderDevice.h"

namespace Engine {

class NullRenderDevice final : public RenderDevice {
public:
    void clear(const Color& /*color*/) override { ++clears_; }
    void drawFilledRect(const Vec2& /*topLeft*/, const Vec2& /*size*/, const Color& /*color*/) override { ++rects_; }
    void present() override {}

    int clearCount() const { return clears_; }
    int rectCount() const { return rects_; }

private:
    int clears_{0};
    int rects_{0};
};

}  // namespace Engine
