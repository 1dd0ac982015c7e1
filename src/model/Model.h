#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <vector>

#include "model/Entities.h"

class BackgroundSignal;

// Owns the drawing entities. Every mutation wakes the background updater through
// the shared BackgroundSignal. A default-constructed Model is empty.
class Model
{
  public:
    Model();
    ~Model();

    Model(const Model &) = delete;
    Model &operator=(const Model &) = delete;

    Line addLine(LineType type, Point start, Point end, Color color = {});
    void addUserText(UserText text);
    void clear();

    const std::vector<Line> &lines() const { return m_lines; }
    const std::set<Point> &vertices() const { return m_vertices; }
    const std::vector<UserText> &userText() const { return m_userText; }

    std::size_t entityCount() const { return m_lines.size() + m_userText.size(); }
    bool empty() const { return entityCount() == 0; }

    // Set when the rendered drawing is stale.
    bool updateNeeded() const { return m_updateNeeded; }
    void setUpdateNeeded(bool needed) { m_updateNeeded = needed; }

    const std::shared_ptr<BackgroundSignal> &backgroundSignal() const { return m_backgroundSignal; }

    // Shares an existing signal, so a replacement Model stays connected to a
    // background thread that is already waiting.
    void bindBackgroundSignal(std::shared_ptr<BackgroundSignal> signal);

  private:
    void markChanged();

    std::vector<Line> m_lines;
    std::set<Point> m_vertices;
    std::vector<UserText> m_userText;
    std::uint64_t m_nextLineId = 1;
    bool m_updateNeeded = false;
    std::shared_ptr<BackgroundSignal> m_backgroundSignal;
};
