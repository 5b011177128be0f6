// Simple color helper.
#pragma once

namespace Engine {

struct Color {
    unsigned char r{0};
    unsigned char g{0};
    unsigned char b{0};
    unsigned char a{255};
};

inline Color withAlpha(Color c, unsigned char a) {
    c.a = a;
    return c;
}

}  // namespace Engine
