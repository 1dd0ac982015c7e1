#pragma once

#include <optional>
#include <string>

#include "app/FramePerf.h"
#include "app/ScreenDimensions.h"
#include "commands/Command.h"
#include "controller/Camera.h"
#include "controller/MessageStack.h"
#include "model/Entities.h"

class Model;

struct LinePreview
{
    LineType type = LineType::ExteriorWall;
    Point start;
    Point end;
};

struct CenterText
{
    std::string top;
    std::string bottom;
};

// Interprets user input into Model edits and queued Commands, and owns the state
// the View shows on top of the drawing.
class Controller
{
  public:
    Controller();
    virtual ~Controller();

    Controller(const Controller &) = delete;
    Controller &operator=(const Controller &) = delete;

    // Returns false when the user asked to quit.
    virtual bool handleInput(Model &model, ScreenDimensions screen, CommandQueue &commands) = 0;

    virtual std::optional<LinePreview> placementPreview() const { return std::nullopt; }

    MessageStack &messageStack() { return m_messageStack; }
    const MessageStack &messageStack() const { return m_messageStack; }

    // Set while a queued command blocks the frame (e.g. an export); cleared by
    // the application once the frame's commands have run.
    bool loading() const { return m_loading; }
    void setLoading(bool loading) { m_loading = loading; }

    const CenterText &centerText() const { return m_centerText; }
    bool displayGrid() const { return m_displayGrid; }
    const Camera &camera() const { return m_camera; }

    const FramePerf &framePerf() const { return m_framePerf; }
    void setFramePerf(const FramePerf &perf) { m_framePerf = perf; }

  protected:
    CenterText m_centerText;
    bool m_displayGrid = false;
    Camera m_camera;

  private:
    MessageStack m_messageStack;
    bool m_loading = false;
    FramePerf m_framePerf;
};
