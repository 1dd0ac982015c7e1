#pragma once

#include <SDL.h>

#include <cstdlib>

#include "model/Entities.h"

struct RenderStats
{
    int drawCalls = 0;
};

inline void countedRenderClear(SDL_Renderer *renderer, RenderStats &stats)
{
    ++stats.drawCalls;
    SDL_RenderClear(renderer);
}

inline void countedRenderCopy(SDL_Renderer *renderer, SDL_Texture *texture, const SDL_Rect *src, const SDL_Rect *dst,
                              RenderStats &stats)
{
    ++stats.drawCalls;
    SDL_RenderCopy(renderer, texture, src, dst);
}

inline void countedRenderDrawLine(SDL_Renderer *renderer, int x1, int y1, int x2, int y2, RenderStats &stats)
{
    ++stats.drawCalls;
    SDL_RenderDrawLine(renderer, x1, y1, x2, y2);
}

inline void setDrawColor(SDL_Renderer *renderer, const Color &color)
{
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, 255);
}

// Thick segments are drawn as parallel one-pixel lines offset across the
// dominant axis.
inline void drawThickLine(SDL_Renderer *renderer, const Point &a, const Point &b, int thickness, RenderStats &stats)
{
    const int half = thickness / 2;
    const bool steep = std::abs(b.y - a.y) > std::abs(b.x - a.x);
    for (int offset = -half; offset <= half - (thickness % 2 == 0 ? 1 : 0); ++offset)
    {
        if (steep)
        {
            countedRenderDrawLine(renderer, a.x + offset, a.y, b.x + offset, b.y, stats);
        }
        else
        {
            countedRenderDrawLine(renderer, a.x, a.y + offset, b.x, b.y + offset, stats);
        }
    }
}

inline void drawFilledCircle(SDL_Renderer *renderer, const Point &pos, int radius, RenderStats &stats)
{
    ++stats.drawCalls;
    for (int dy = -radius; dy <= radius; ++dy)
    {
        for (int dx = -radius; dx <= radius; ++dx)
        {
            if (dx * dx + dy * dy <= radius * radius)
            {
                SDL_RenderDrawPoint(renderer, pos.x + dx, pos.y + dy);
            }
        }
    }
}
