#include "app/TextRenderer.h"

#include "app/RenderUtils.h"

#include <SDL_ttf.h>

#include <iostream>
#include <memory>

namespace
{
struct SurfaceDeleter
{
    void operator()(SDL_Surface *surface) const { SDL_FreeSurface(surface); }
};

struct TextureDeleter
{
    void operator()(SDL_Texture *texture) const { SDL_DestroyTexture(texture); }
};
} // namespace

TextRenderer::~TextRenderer()
{
    unload();
}

bool TextRenderer::load(const std::string &path, int pointSize)
{
    unload();
    m_font = TTF_OpenFont(path.c_str(), pointSize);
    if (!m_font)
    {
        std::cerr << "[font] " << path << ": " << TTF_GetError() << '\n';
        return false;
    }
    const int skip = TTF_FontLineSkip(m_font);
    m_lineHeight = skip > 0 ? skip : TTF_FontHeight(m_font);
    return true;
}

void TextRenderer::unload()
{
    if (m_font)
    {
        TTF_CloseFont(m_font);
        m_font = nullptr;
    }
    m_lineHeight = 0;
}

int TextRenderer::measureText(const std::string &text) const
{
    int width = 0;
    int height = 0;
    if (!m_font || text.empty() || TTF_SizeUTF8(m_font, text.c_str(), &width, &height) != 0)
    {
        return 0;
    }
    return width;
}

void TextRenderer::drawText(SDL_Renderer *renderer, const std::string &text, int x, int y, RenderStats &stats,
                            SDL_Color color) const
{
    if (!renderer || !m_font || text.empty())
    {
        return;
    }

    std::unique_ptr<SDL_Surface, SurfaceDeleter> surface(TTF_RenderUTF8_Blended(m_font, text.c_str(), color));
    if (!surface)
    {
        return;
    }
    std::unique_ptr<SDL_Texture, TextureDeleter> texture(SDL_CreateTextureFromSurface(renderer, surface.get()));
    if (!texture)
    {
        return;
    }
    const SDL_Rect dest{x, y, surface->w, surface->h};
    countedRenderCopy(renderer, texture.get(), nullptr, &dest, stats);
}

void TextRenderer::drawCentered(SDL_Renderer *renderer, const std::string &text, int centerX, int y, RenderStats &stats,
                                SDL_Color color) const
{
    drawText(renderer, text, centerX - measureText(text) / 2, y, stats, color);
}
