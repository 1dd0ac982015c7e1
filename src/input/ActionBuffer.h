#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

enum class ActionId : std::uint16_t
{
    Quit = 0,
    SaveDrawing,
    ExportDrawing,
    DrawExteriorWall,
    DrawInteriorWall,
    Measure,
    CancelPlacement,
    ToggleGrid,
    PlacePoint,
    AddText,
    ConfirmText,
    EraseText,
    ResetCamera,
    Pan,
    Count
};

struct PointerPayload
{
    int x = 0;
    int y = 0;
};

struct ActionEvent
{
    ActionId id = ActionId::Count;
    bool pressed = false;
    bool released = false;
    std::optional<PointerPayload> pointer;
};

struct PointerState
{
    bool hasPosition = false;
    int x = 0;
    int y = 0;
    bool left = false;
    bool right = false;
};

// Holds the last few sampled input frames. The controller reads the newest;
// older ones drop out by count or by age.
class ActionBuffer
{
  public:
    struct Frame
    {
        std::uint64_t sequence = 0;
        double timestampMs = 0.0;
        std::vector<ActionEvent> events;
        std::vector<std::string> droppedFiles;
        PointerState pointer;
        // Mouse wheel notches; positive is away from the user.
        int wheel = 0;
        std::string text;
        bool quitRequested = false;
    };

    explicit ActionBuffer(std::size_t capacity = 2) { setCapacity(capacity); }

    // Zero is treated as one.
    void setCapacity(std::size_t capacity);
    std::size_t capacity() const { return m_capacity; }

    // A frame with the sequence number of the newest one replaces it.
    void pushFrame(Frame frame);
    void expireOlderThan(double minTimestampMs);

    const Frame *latest() const { return m_frames.empty() ? nullptr : &m_frames.back(); }

  private:
    void trim();

    std::size_t m_capacity = 1;
    std::deque<Frame> m_frames;
};
