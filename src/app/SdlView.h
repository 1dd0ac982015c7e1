#pragma once

#include <SDL.h>

#include <filesystem>
#include <string>

#include "app/RenderUtils.h"
#include "app/TextRenderer.h"
#include "app/View.h"
#include "config/AppConfig.h"
#include "controller/Camera.h"

struct LinePreview;

// SDL2 window/renderer View. At unit zoom one pixel is one inch of drawing space.
class SdlView : public View
{
  public:
    SdlView();
    ~SdlView() override;

    SdlView(const SdlView &) = delete;
    SdlView &operator=(const SdlView &) = delete;

    bool initialize(const AppConfig &config);

    ScreenDimensions screenDimensions() const override;
    void update(const Model &model, const Controller &controller) override;
    void exit() override;
    bool exportDrawing(const Model &model, const std::filesystem::path &path) override;

    const RenderStats &renderStats() const { return m_renderStats; }

  private:
    void drawBackground();
    void drawGrid(const ScreenDimensions &screen, const Camera &camera, int interval);
    void drawModel(const Model &model, const Camera &camera);
    void drawPreview(const LinePreview &preview, const Camera &camera);
    void drawOverlay(const Controller &controller, const ScreenDimensions &screen);

    SDL_Window *m_window = nullptr;
    SDL_Renderer *m_renderer = nullptr;
    TextRenderer m_smallFont;
    TextRenderer m_largeFont;
    RenderStats m_renderStats;
    int m_gridInterval = 6;
    bool m_sdlInitialized = false;
    bool m_exited = false;
};
