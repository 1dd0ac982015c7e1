#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

class BackgroundSignal;
class TelemetrySink;

// Performs out-of-band work whenever the Model signals. There is no payload yet;
// future work that mutates the Model must do so while holding the signal's lock.
class BackgroundUpdater
{
  public:
    void update(BackgroundSignal &signal);

    [[nodiscard]] std::uint64_t updateCount() const { return m_updates; }

  private:
    std::uint64_t m_updates = 0;
};

// Background thread body. Runs one updater until |running| is false; the flag is
// only re-checked after each wait returns, so shutdown must notify the signal.
void runBackgroundUpdates(const std::atomic<bool> &running,
                          std::shared_ptr<BackgroundSignal> signal,
                          std::shared_ptr<TelemetrySink> telemetry);
