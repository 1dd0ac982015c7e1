#include "input/ActionBuffer.h"

#include <algorithm>
#include <utility>

void ActionBuffer::setCapacity(std::size_t capacity)
{
    m_capacity = std::max<std::size_t>(capacity, 1);
    trim();
}

void ActionBuffer::pushFrame(Frame frame)
{
    const bool sameFrame = !m_frames.empty() && m_frames.back().sequence == frame.sequence;
    if (sameFrame)
    {
        m_frames.back() = std::move(frame);
        return;
    }
    m_frames.push_back(std::move(frame));
    trim();
}

void ActionBuffer::expireOlderThan(double minTimestampMs)
{
    const auto firstFresh = std::find_if(m_frames.begin(), m_frames.end(),
                                         [minTimestampMs](const Frame &frame) { return frame.timestampMs >= minTimestampMs; });
    m_frames.erase(m_frames.begin(), firstFresh);
}

void ActionBuffer::trim()
{
    while (m_frames.size() > m_capacity)
    {
        m_frames.pop_front();
    }
}
