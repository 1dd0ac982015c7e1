#pragma once

#include <memory>
#include <mutex>

#include "telemetry/TelemetrySink.h"

// Process-wide home of the shared TelemetrySink. A lookup never fails: a
// NullTelemetrySink stands in until a real sink is registered.
class ServiceLocator
{
  public:
    static ServiceLocator &instance();

    // Null restores the NullTelemetrySink.
    void setTelemetrySink(std::shared_ptr<TelemetrySink> sink);
    std::shared_ptr<TelemetrySink> telemetrySink() const;

    void clear();

  private:
    ServiceLocator();

    mutable std::mutex m_mutex;
    std::shared_ptr<TelemetrySink> m_nullTelemetry;
    std::shared_ptr<TelemetrySink> m_telemetry;
};
