#include "model/Model.h"

#include "background/BackgroundSignal.h"

#include <utility>

Model::Model() : m_backgroundSignal(std::make_shared<BackgroundSignal>()) {}

Model::~Model() = default;

Line Model::addLine(LineType type, Point start, Point end, Color color)
{
    Line line;
    line.id = m_nextLineId++;
    line.type = type;
    line.start = start;
    line.end = end;
    line.color = color;
    m_lines.push_back(line);
    m_vertices.insert(start);
    m_vertices.insert(end);
    markChanged();
    return line;
}

void Model::addUserText(UserText text)
{
    m_userText.push_back(std::move(text));
    markChanged();
}

void Model::clear()
{
    m_lines.clear();
    m_vertices.clear();
    m_userText.clear();
    m_nextLineId = 1;
    markChanged();
}

void Model::bindBackgroundSignal(std::shared_ptr<BackgroundSignal> signal)
{
    if (signal)
    {
        m_backgroundSignal = std::move(signal);
    }
}

void Model::markChanged()
{
    m_updateNeeded = true;
    m_backgroundSignal->notifyAll();
}
