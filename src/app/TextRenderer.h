#pragma once

#include <SDL.h>

#include <string>

struct RenderStats;
typedef struct _TTF_Font TTF_Font;

// One TTF font at one point size. Drawing without a loaded font is a no-op, so
// a missing font file only costs the text.
class TextRenderer
{
  public:
    TextRenderer() = default;
    ~TextRenderer();

    TextRenderer(const TextRenderer &) = delete;
    TextRenderer &operator=(const TextRenderer &) = delete;

    bool load(const std::string &path, int pointSize);
    void unload();

    int getLineHeight() const { return m_lineHeight; }
    int measureText(const std::string &text) const;

    void drawText(SDL_Renderer *renderer, const std::string &text, int x, int y, RenderStats &stats,
                  SDL_Color color) const;
    // Horizontal midpoint of the text sits on centerX.
    void drawCentered(SDL_Renderer *renderer, const std::string &text, int centerX, int y, RenderStats &stats,
                      SDL_Color color) const;

  private:
    TTF_Font *m_font = nullptr;
    int m_lineHeight = 0;
};
