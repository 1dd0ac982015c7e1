#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// User-visible notifications, oldest first. Messages expire after a fixed
// duration measured from insertion.
class MessageStack
{
  public:
    struct Message
    {
        std::string text;
        std::uint32_t timeMs = 0;
    };

    using Clock = std::function<std::uint32_t()>;

    static constexpr std::uint32_t kDefaultDurationMs = 5000;

    MessageStack();
    explicit MessageStack(Clock clock, std::uint32_t durationMs = kDefaultDurationMs);

    void insert(const std::vector<std::string> &messages);

    // Drops expired messages.
    void update();
    void update(std::uint32_t nowMs);

    void clear() { m_messages.clear(); }

    void setDuration(std::uint32_t durationMs) { m_durationMs = durationMs; }
    std::uint32_t duration() const { return m_durationMs; }

    const std::vector<Message> &messages() const { return m_messages; }
    std::size_t size() const { return m_messages.size(); }
    bool empty() const { return m_messages.empty(); }
    const std::string &latest() const;

  private:
    Clock m_clock;
    std::uint32_t m_durationMs;
    std::vector<Message> m_messages;
};
