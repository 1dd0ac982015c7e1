#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

// Wake/sleep gate shared between the main loop and the background updater. It
// guards only the wait/notify protocol; Model fields are not protected by it
// unless background work explicitly takes lock() around a mutation.
//
// A wait ends when a notification arrives after the wait began, or once
// shutdown has been latched. Shutdown stays latched, so a waiter that arrives
// after notifyShutdown() returns at once instead of sleeping forever.
class BackgroundSignal
{
  public:
    BackgroundSignal() = default;
    BackgroundSignal(const BackgroundSignal &) = delete;
    BackgroundSignal &operator=(const BackgroundSignal &) = delete;

    [[nodiscard]] std::unique_lock<std::mutex> lock();

    // |lock| must own this signal's mutex.
    void wait(std::unique_lock<std::mutex> &lock);

    void notifyAll();
    void notifyShutdown();

    [[nodiscard]] bool shutdownRequested() const;
    [[nodiscard]] std::uint64_t notificationCount() const;
    [[nodiscard]] std::size_t waiterCount() const;

  private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::uint64_t m_generation = 0;
    std::uint64_t m_notifications = 0;
    std::size_t m_waiters = 0;
    bool m_shutdown = false;
};
