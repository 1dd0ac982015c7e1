#include "app/SdlView.h"

#include <SDL_image.h>
#include <SDL_ttf.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <system_error>

#include "controller/Controller.h"
#include "model/Model.h"

namespace
{
constexpr SDL_Color kTextColor{20, 20, 20, 255};
constexpr SDL_Color kMessageColor{30, 60, 140, 255};
constexpr SDL_Color kWarningColor{180, 40, 40, 255};
constexpr Color kBackgroundColor{245, 245, 240};
constexpr Color kGridColor{215, 215, 210};
constexpr Color kVertexColor{200, 60, 40};
constexpr Color kPreviewColor{90, 140, 220};
constexpr int kVertexRadius = 3;
constexpr int kOverlayMargin = 12;

// Grid lines every foot when the snap interval is six inches.
constexpr int kGridMajorMultiple = 2;
// Below this spacing the grid turns into noise and is skipped.
constexpr double kMinGridSpacing = 4.0;

int scaledThickness(LineType type, const Camera &camera)
{
    return std::max(1, static_cast<int>(std::lround(lineThickness(type) * camera.scale)));
}
} // namespace

SdlView::SdlView() = default;

SdlView::~SdlView()
{
    exit();
}

bool SdlView::initialize(const AppConfig &config)
{
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
    {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << '\n';
        return false;
    }
    m_sdlInitialized = true;

    if ((IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG) == 0)
    {
        std::cerr << "IMG_Init failed: " << IMG_GetError() << '\n';
        exit();
        return false;
    }

    if (TTF_Init() != 0)
    {
        std::cerr << "TTF_Init failed: " << TTF_GetError() << '\n';
        exit();
        return false;
    }

    m_window = SDL_CreateWindow(config.window.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                config.window.width, config.window.height, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!m_window)
    {
        std::cerr << "Failed to create window: " << SDL_GetError() << '\n';
        exit();
        return false;
    }
    SDL_SetWindowMinimumSize(m_window, config.window.minWidth, config.window.minHeight);

    m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_TARGETTEXTURE);
    if (!m_renderer)
    {
        std::cerr << "Failed to create renderer: " << SDL_GetError() << '\n';
        exit();
        return false;
    }

    // Missing fonts only cost the overlay text.
    m_smallFont.load(config.fonts.uiPath, config.fonts.smallSize);
    m_largeFont.load(config.fonts.uiPath, config.fonts.largeSize);

    m_gridInterval = config.input.snapInterval > 0 ? config.input.snapInterval : 6;
    m_exited = false;
    return true;
}

ScreenDimensions SdlView::screenDimensions() const
{
    ScreenDimensions screen;
    if (m_renderer && SDL_GetRendererOutputSize(m_renderer, &screen.width, &screen.height) == 0)
    {
        return screen;
    }
    if (m_window)
    {
        SDL_GetWindowSize(m_window, &screen.width, &screen.height);
    }
    return screen;
}

void SdlView::update(const Model &model, const Controller &controller)
{
    if (!m_renderer)
    {
        return;
    }
    m_renderStats = RenderStats{};
    const ScreenDimensions screen = screenDimensions();

    const Camera &camera = controller.camera();
    drawBackground();
    if (controller.displayGrid())
    {
        drawGrid(screen, camera, m_gridInterval);
    }
    drawModel(model, camera);
    if (const auto preview = controller.placementPreview())
    {
        drawPreview(*preview, camera);
    }
    drawOverlay(controller, screen);

    SDL_RenderPresent(m_renderer);
}

void SdlView::drawBackground()
{
    setDrawColor(m_renderer, kBackgroundColor);
    countedRenderClear(m_renderer, m_renderStats);
}

void SdlView::drawGrid(const ScreenDimensions &screen, const Camera &camera, int interval)
{
    const double spacing = interval * kGridMajorMultiple * camera.scale;
    if (spacing < kMinGridSpacing)
    {
        return;
    }
    setDrawColor(m_renderer, kGridColor);
    // First grid line at or left of the window edge.
    const double startX = -camera.x - std::floor(-camera.x / spacing) * spacing - spacing;
    const double startY = -camera.y - std::floor(-camera.y / spacing) * spacing - spacing;
    for (double x = startX; x < screen.width; x += spacing)
    {
        const int column = static_cast<int>(std::lround(x));
        countedRenderDrawLine(m_renderer, column, 0, column, screen.height, m_renderStats);
    }
    for (double y = startY; y < screen.height; y += spacing)
    {
        const int row = static_cast<int>(std::lround(y));
        countedRenderDrawLine(m_renderer, 0, row, screen.width, row, m_renderStats);
    }
}

void SdlView::drawModel(const Model &model, const Camera &camera)
{
    for (const Line &line : model.lines())
    {
        setDrawColor(m_renderer, line.color);
        drawThickLine(m_renderer, camera.toScreen(line.start), camera.toScreen(line.end), scaledThickness(line.type, camera),
                      m_renderStats);
    }

    setDrawColor(m_renderer, kVertexColor);
    for (const Point &vertex : model.vertices())
    {
        drawFilledCircle(m_renderer, camera.toScreen(vertex), kVertexRadius, m_renderStats);
    }

    for (const UserText &text : model.userText())
    {
        const Point at = camera.toScreen(text.position);
        m_smallFont.drawText(m_renderer, text.text, at.x, at.y, m_renderStats, kTextColor);
    }
}

void SdlView::drawPreview(const LinePreview &preview, const Camera &camera)
{
    const Point start = camera.toScreen(preview.start);
    setDrawColor(m_renderer, kPreviewColor);
    drawThickLine(m_renderer, start, camera.toScreen(preview.end), scaledThickness(preview.type, camera), m_renderStats);
    drawFilledCircle(m_renderer, start, kVertexRadius, m_renderStats);
}

void SdlView::drawOverlay(const Controller &controller, const ScreenDimensions &screen)
{
    const CenterText &center = controller.centerText();
    const int centerX = screen.width / 2;
    if (!center.top.empty())
    {
        m_largeFont.drawCentered(m_renderer, center.top, centerX, kOverlayMargin, m_renderStats, kTextColor);
    }
    if (!center.bottom.empty())
    {
        const int y = screen.height - kOverlayMargin - m_largeFont.getLineHeight();
        m_largeFont.drawCentered(m_renderer, center.bottom, centerX, y, m_renderStats, kTextColor);
    }

    int y = kOverlayMargin;
    for (const MessageStack::Message &message : controller.messageStack().messages())
    {
        m_smallFont.drawText(m_renderer, message.text, kOverlayMargin, y, m_renderStats, kMessageColor);
        y += m_smallFont.getLineHeight();
    }

    const FramePerf &perf = controller.framePerf();
    char fpsText[64];
    std::snprintf(fpsText, sizeof(fpsText), "FPS %.0f  frame %.1f ms  zoom %.2f", perf.fps, perf.msFrame,
                  controller.camera().scale);
    const int fpsWidth = m_smallFont.measureText(fpsText);
    m_smallFont.drawText(m_renderer, fpsText, screen.width - fpsWidth - kOverlayMargin, kOverlayMargin, m_renderStats,
                         perf.budgetExceeded ? kWarningColor : kTextColor);

    if (controller.loading())
    {
        m_largeFont.drawCentered(m_renderer, "Loading...", centerX, screen.height / 2, m_renderStats, kWarningColor);
    }
}

bool SdlView::exportDrawing(const Model &model, const std::filesystem::path &path)
{
    if (!m_renderer)
    {
        std::cerr << "[export] " << path.string() << ": no renderer\n";
        return false;
    }

    const ScreenDimensions screen = screenDimensions();
    if (screen.width <= 0 || screen.height <= 0)
    {
        std::cerr << "[export] " << path.string() << ": empty drawing surface\n";
        return false;
    }

    SDL_Texture *target = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGBA8888, SDL_TEXTUREACCESS_TARGET,
                                            screen.width, screen.height);
    if (!target)
    {
        std::cerr << "[export] " << path.string() << ": " << SDL_GetError() << '\n';
        return false;
    }

    SDL_Texture *previousTarget = SDL_GetRenderTarget(m_renderer);
    SDL_SetRenderTarget(m_renderer, target);
    drawBackground();
    // Exports are drawn at unit zoom from the drawing origin.
    drawModel(model, Camera{});

    SDL_Surface *surface =
        SDL_CreateRGBSurfaceWithFormat(0, screen.width, screen.height, 32, SDL_PIXELFORMAT_RGBA8888);
    bool success = false;
    if (surface &&
        SDL_RenderReadPixels(m_renderer, nullptr, SDL_PIXELFORMAT_RGBA8888, surface->pixels, surface->pitch) == 0)
    {
        std::error_code ec;
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        success = IMG_SavePNG(surface, path.string().c_str()) == 0;
        if (!success)
        {
            std::cerr << "[export] " << path.string() << ": " << IMG_GetError() << '\n';
        }
    }
    else
    {
        std::cerr << "[export] " << path.string() << ": " << SDL_GetError() << '\n';
    }

    if (surface)
    {
        SDL_FreeSurface(surface);
    }
    SDL_SetRenderTarget(m_renderer, previousTarget);
    SDL_DestroyTexture(target);
    return success;
}

void SdlView::exit()
{
    if (m_exited)
    {
        return;
    }
    m_exited = true;

    m_smallFont.unload();
    m_largeFont.unload();
    if (m_renderer)
    {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window)
    {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized)
    {
        if (TTF_WasInit())
        {
            TTF_Quit();
        }
        IMG_Quit();
        SDL_Quit();
        m_sdlInitialized = false;
    }
}
