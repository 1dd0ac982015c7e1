#include "controller/MessageStack.h"

#include <SDL.h>

#include <algorithm>
#include <utility>

MessageStack::MessageStack() : MessageStack([] { return static_cast<std::uint32_t>(SDL_GetTicks()); }) {}

MessageStack::MessageStack(Clock clock, std::uint32_t durationMs)
    : m_clock(std::move(clock)), m_durationMs(durationMs)
{
}

void MessageStack::insert(const std::vector<std::string> &messages)
{
    const std::uint32_t now = m_clock ? m_clock() : 0;
    for (const std::string &text : messages)
    {
        m_messages.push_back(Message{text, now});
    }
}

void MessageStack::update()
{
    update(m_clock ? m_clock() : 0);
}

void MessageStack::update(std::uint32_t nowMs)
{
    const std::uint32_t duration = m_durationMs;
    m_messages.erase(std::remove_if(m_messages.begin(), m_messages.end(),
                                    [nowMs, duration](const Message &message) {
                                        return nowMs >= message.timeMs && nowMs - message.timeMs > duration;
                                    }),
                     m_messages.end());
}

const std::string &MessageStack::latest() const
{
    static const std::string kEmpty;
    return m_messages.empty() ? kEmpty : m_messages.back().text;
}
