#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "config/AppConfig.h"
#include "controller/Controller.h"
#include "input/ActionBuffer.h"
#include "input/InputMapper.h"

// SDL-driven Controller: pumps the event queue through the InputMapper, then
// applies the sampled frame to the drawing.
class InteractiveController : public Controller
{
  public:
    static constexpr std::uint32_t kSaveThrottleMs = 1000;
    static constexpr std::uint32_t kExportThrottleMs = 5000;

    explicit InteractiveController(const AppConfig &config);

    bool handleInput(Model &model, ScreenDimensions screen, CommandQueue &commands) override;

    // Applies one sampled input frame. Returns false on a quit request.
    bool processFrame(const ActionBuffer::Frame &frame,
                      Model &model,
                      ScreenDimensions screen,
                      CommandQueue &commands,
                      std::uint32_t nowMs);

    std::optional<LinePreview> placementPreview() const override;

    std::optional<LineType> placementType() const { return m_placementType; }
    // Text typed so far while placing a label.
    const std::optional<std::string> &textEntry() const { return m_textEntry; }
    Point cursor() const { return m_cursor; }
    Point snap(Point point) const;

  private:
    void beginPlacement(LineType type);
    void cancelPlacement();
    void placePoint(Model &model, Point point);
    void confirmText(Model &model);
    void updateCamera(const ActionBuffer::Frame &frame, ScreenDimensions screen);
    void requestSave(CommandQueue &commands, std::uint32_t nowMs);
    void requestExport(CommandQueue &commands, std::uint32_t nowMs);
    void refreshCenterText();

    InputMapper m_inputMapper;
    ActionBuffer m_actionBuffer;
    std::uint64_t m_frameSequence = 0;

    SaveConfig m_saves;
    int m_snapInterval = 6;

    std::optional<LineType> m_placementType;
    std::optional<Point> m_placementStart;
    Point m_cursor;
    std::string m_lastMeasurement;
    std::optional<std::string> m_textEntry;
    std::optional<Point> m_panAnchor;

    std::optional<std::uint32_t> m_lastSaveMs;
    std::optional<std::uint32_t> m_lastExportMs;
};
