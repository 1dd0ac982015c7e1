#pragma once

#include <algorithm>
#include <cmath>

#include "model/Entities.h"

// Maps drawing coordinates (inches) to window pixels. The offset is in pixels
// at the current scale: screen = world * scale - offset.
struct Camera
{
    static constexpr double kZoomStep = 0.05;
    static constexpr double kMinScale = 0.05;
    static constexpr double kMaxScale = 10.0;

    double x = 0.0;
    double y = 0.0;
    double scale = 1.0;

    Point toWorld(int screenX, int screenY) const
    {
        return Point{static_cast<int>(std::lround((screenX + x) / scale)),
                     static_cast<int>(std::lround((screenY + y) / scale))};
    }

    Point toScreen(const Point &world) const
    {
        return Point{static_cast<int>(std::lround(world.x * scale - x)),
                     static_cast<int>(std::lround(world.y * scale - y))};
    }

    void pan(int dx, int dy)
    {
        x += dx;
        y += dy;
    }

    // Positive steps zoom in. The drawing point under (anchorX, anchorY) stays put.
    void zoom(int steps, int anchorX, int anchorY)
    {
        const double worldX = (anchorX + x) / scale;
        const double worldY = (anchorY + y) / scale;
        scale = std::clamp(scale + steps * kZoomStep, kMinScale, kMaxScale);
        x = worldX * scale - anchorX;
        y = worldY * scale - anchorY;
    }

    void reset() { *this = Camera{}; }
};
