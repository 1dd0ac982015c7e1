#include "controller/InteractiveController.h"

#include <SDL.h>

#include <cmath>
#include <memory>
#include <string>

#include "commands/ExportCommand.h"
#include "commands/LoadDrawingCommand.h"
#include "commands/SaveDrawingCommand.h"
#include "model/Model.h"
#include "persistence/SaveFileWriter.h"

namespace
{

Color lineColor(LineType type)
{
    switch (type)
    {
    case LineType::ExteriorWall:
        return Color{0, 0, 0};
    case LineType::InteriorWall:
        return Color{80, 80, 80};
    case LineType::Measurement:
        return Color{0, 120, 200};
    }
    return Color{};
}

const char *placementLabel(LineType type)
{
    switch (type)
    {
    case LineType::ExteriorWall:
        return "Exterior wall";
    case LineType::InteriorWall:
        return "Interior wall";
    case LineType::Measurement:
        return "Measure";
    }
    return "";
}

double distance(const Point &a, const Point &b)
{
    return std::hypot(static_cast<double>(b.x - a.x), static_cast<double>(b.y - a.y));
}

} // namespace

InteractiveController::InteractiveController(const AppConfig &config)
    : m_actionBuffer(static_cast<std::size_t>(config.input.bufferFrames > 0 ? config.input.bufferFrames : 1)),
      m_saves(config.saves),
      m_snapInterval(config.input.snapInterval > 0 ? config.input.snapInterval : 6)
{
    m_inputMapper.configure(config.input);
    messageStack().setDuration(config.messages.durationMs);
    m_displayGrid = true;
}

bool InteractiveController::handleInput(Model &model, ScreenDimensions screen, CommandQueue &commands)
{
    m_inputMapper.beginEventPump();
    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        m_inputMapper.handleEvent(event);
    }

    const std::uint32_t now = SDL_GetTicks();
    m_inputMapper.sampleFrame(static_cast<double>(now), ++m_frameSequence, m_actionBuffer);
    messageStack().update(now);

    const ActionBuffer::Frame *frame = m_actionBuffer.latest();
    if (!frame)
    {
        return true;
    }
    return processFrame(*frame, model, screen, commands, now);
}

bool InteractiveController::processFrame(const ActionBuffer::Frame &frame,
                                         Model &model,
                                         ScreenDimensions screen,
                                         CommandQueue &commands,
                                         std::uint32_t nowMs)
{
    if (frame.quitRequested)
    {
        return false;
    }

    updateCamera(frame, screen);
    if (frame.pointer.hasPosition)
    {
        m_cursor = snap(m_camera.toWorld(frame.pointer.x, frame.pointer.y));
    }
    if (m_textEntry)
    {
        *m_textEntry += frame.text;
    }

    bool keepRunning = true;
    for (const ActionEvent &event : frame.events)
    {
        if (event.id == ActionId::Pan)
        {
            if (event.pressed && event.pointer)
            {
                m_panAnchor = Point{event.pointer->x, event.pointer->y};
            }
            else if (event.released)
            {
                m_panAnchor.reset();
            }
            continue;
        }
        if (!event.pressed)
        {
            continue;
        }
        // Typing owns the keyboard; hotkeys without a modifier would eat letters.
        const bool typing = m_textEntry.has_value();
        switch (event.id)
        {
        case ActionId::Quit:
            keepRunning = false;
            break;
        case ActionId::SaveDrawing:
            requestSave(commands, nowMs);
            break;
        case ActionId::ExportDrawing:
            requestExport(commands, nowMs);
            break;
        case ActionId::DrawExteriorWall:
            if (!typing)
            {
                beginPlacement(LineType::ExteriorWall);
            }
            break;
        case ActionId::DrawInteriorWall:
            if (!typing)
            {
                beginPlacement(LineType::InteriorWall);
            }
            break;
        case ActionId::Measure:
            if (!typing)
            {
                beginPlacement(LineType::Measurement);
            }
            break;
        case ActionId::CancelPlacement:
            cancelPlacement();
            break;
        case ActionId::AddText:
            cancelPlacement();
            m_textEntry = std::string();
            break;
        case ActionId::ConfirmText:
            confirmText(model);
            break;
        case ActionId::EraseText:
            if (m_textEntry && !m_textEntry->empty())
            {
                // Drop one UTF-8 code point.
                std::size_t cut = m_textEntry->size() - 1;
                while (cut > 0 && (static_cast<unsigned char>((*m_textEntry)[cut]) & 0xC0) == 0x80)
                {
                    --cut;
                }
                m_textEntry->erase(cut);
            }
            break;
        case ActionId::ResetCamera:
            m_camera.reset();
            break;
        case ActionId::ToggleGrid:
            m_displayGrid = !m_displayGrid;
            break;
        case ActionId::PlacePoint:
        {
            if (event.pointer)
            {
                const int x = event.pointer->x;
                const int y = event.pointer->y;
                const bool onScreen = x >= 0 && y >= 0 && (screen.width <= 0 || x <= screen.width) &&
                                      (screen.height <= 0 || y <= screen.height);
                if (!onScreen)
                {
                    break;
                }
                m_cursor = snap(m_camera.toWorld(x, y));
            }
            placePoint(model, m_cursor);
            break;
        }
        case ActionId::Pan:
        case ActionId::Count:
            break;
        }
    }

    for (const std::string &file : frame.droppedFiles)
    {
        commands.push_back(std::make_unique<LoadDrawingCommand>(file));
    }

    refreshCenterText();
    return keepRunning;
}

std::optional<LinePreview> InteractiveController::placementPreview() const
{
    if (!m_placementType || !m_placementStart)
    {
        return std::nullopt;
    }
    LinePreview preview;
    preview.type = *m_placementType;
    preview.start = *m_placementStart;
    preview.end = m_cursor;
    return preview;
}

Point InteractiveController::snap(Point point) const
{
    const auto snapAxis = [this](int value) {
        const double steps = std::round(static_cast<double>(value) / static_cast<double>(m_snapInterval));
        return static_cast<int>(steps) * m_snapInterval;
    };
    return Point{snapAxis(point.x), snapAxis(point.y)};
}

void InteractiveController::updateCamera(const ActionBuffer::Frame &frame, ScreenDimensions screen)
{
    if (frame.wheel != 0)
    {
        const int anchorX = frame.pointer.hasPosition ? frame.pointer.x : screen.width / 2;
        const int anchorY = frame.pointer.hasPosition ? frame.pointer.y : screen.height / 2;
        m_camera.zoom(frame.wheel, anchorX, anchorY);
    }
    if (m_panAnchor && frame.pointer.hasPosition)
    {
        // Dragging moves the drawing with the pointer.
        m_camera.pan(m_panAnchor->x - frame.pointer.x, m_panAnchor->y - frame.pointer.y);
        m_panAnchor = Point{frame.pointer.x, frame.pointer.y};
    }
}

void InteractiveController::beginPlacement(LineType type)
{
    m_textEntry.reset();
    m_placementType = type;
    m_placementStart.reset();
    m_lastMeasurement.clear();
}

void InteractiveController::cancelPlacement()
{
    m_textEntry.reset();
    m_placementType.reset();
    m_placementStart.reset();
    m_lastMeasurement.clear();
}

void InteractiveController::placePoint(Model &model, Point point)
{
    if (!m_placementType)
    {
        return;
    }
    if (!m_placementStart)
    {
        m_placementStart = point;
        return;
    }
    if (*m_placementStart == point)
    {
        return;
    }

    const Line line = model.addLine(*m_placementType, *m_placementStart, point, lineColor(*m_placementType));
    if (line.type == LineType::Measurement)
    {
        m_lastMeasurement = formatFeetInches(line.length());
        m_placementStart.reset();
    }
    else
    {
        // Walls chain: the end of one segment starts the next.
        m_placementStart = point;
    }
}

void InteractiveController::confirmText(Model &model)
{
    if (!m_textEntry)
    {
        return;
    }
    if (!m_textEntry->empty())
    {
        model.addUserText(UserText{*m_textEntry, m_cursor});
    }
    m_textEntry.reset();
}

void InteractiveController::requestSave(CommandQueue &commands, std::uint32_t nowMs)
{
    if (m_lastSaveMs && nowMs - *m_lastSaveMs < kSaveThrottleMs)
    {
        return;
    }
    m_lastSaveMs = nowMs;
    commands.push_back(std::make_unique<SaveDrawingCommand>(nextSaveFilename(m_saves.directory)));
}

void InteractiveController::requestExport(CommandQueue &commands, std::uint32_t nowMs)
{
    if (m_lastExportMs && nowMs - *m_lastExportMs < kExportThrottleMs)
    {
        return;
    }
    m_lastExportMs = nowMs;
    const std::filesystem::path path = std::filesystem::path(m_saves.directory) / m_saves.exportFile;
    commands.push_back(std::make_unique<ExportCommand>(path));
    messageStack().insert({"Exported drawing: " + path.string()});
    setLoading(true);
}

void InteractiveController::refreshCenterText()
{
    if (m_textEntry)
    {
        m_centerText.top = "Move the cursor to the text location, type, and press Enter";
        m_centerText.bottom = *m_textEntry;
        return;
    }
    if (!m_placementType)
    {
        m_centerText = CenterText{};
        return;
    }

    m_centerText.top = std::string(placementLabel(*m_placementType)) +
                       (m_placementStart ? ": click the end point" : ": click the start point");
    if (*m_placementType == LineType::Measurement)
    {
        if (m_placementStart)
        {
            m_centerText.bottom = formatFeetInches(distance(*m_placementStart, m_cursor));
        }
        else
        {
            m_centerText.bottom = m_lastMeasurement;
        }
    }
    else
    {
        m_centerText.bottom = "Escape to finish";
    }
}
