#include "background/BackgroundSignal.h"

std::unique_lock<std::mutex> BackgroundSignal::lock()
{
    return std::unique_lock<std::mutex>(m_mutex);
}

void BackgroundSignal::wait(std::unique_lock<std::mutex> &lock)
{
    const std::uint64_t seen = m_generation;
    ++m_waiters;
    m_condition.wait(lock, [this, seen] { return m_shutdown || m_generation != seen; });
    --m_waiters;
}

void BackgroundSignal::notifyAll()
{
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        ++m_generation;
        ++m_notifications;
    }
    m_condition.notify_all();
}

void BackgroundSignal::notifyShutdown()
{
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_shutdown = true;
        ++m_generation;
        ++m_notifications;
    }
    m_condition.notify_all();
}

bool BackgroundSignal::shutdownRequested() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_shutdown;
}

std::uint64_t BackgroundSignal::notificationCount() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_notifications;
}

std::size_t BackgroundSignal::waiterCount() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_waiters;
}
