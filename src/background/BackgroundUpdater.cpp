#include "background/BackgroundUpdater.h"

#include "background/BackgroundSignal.h"
#include "telemetry/TelemetrySink.h"

#include <string>
#include <utility>

void BackgroundUpdater::update(BackgroundSignal &signal)
{
    auto lock = signal.lock();
    signal.wait(lock);
    ++m_updates;
}

void runBackgroundUpdates(const std::atomic<bool> &running,
                          std::shared_ptr<BackgroundSignal> signal,
                          std::shared_ptr<TelemetrySink> telemetry)
{
    if (!signal)
    {
        return;
    }

    BackgroundUpdater updater;
    while (running.load(std::memory_order_acquire))
    {
        updater.update(*signal);
    }

    recordTelemetry(telemetry, "background.updater.exited",
                    TelemetrySink::Payload{{"updates", std::to_string(updater.updateCount())}});
}
