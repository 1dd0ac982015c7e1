#include "services/ServiceLocator.h"

#include <utility>

ServiceLocator &ServiceLocator::instance()
{
    static ServiceLocator locator;
    return locator;
}

ServiceLocator::ServiceLocator()
    : m_nullTelemetry(std::make_shared<NullTelemetrySink>()), m_telemetry(m_nullTelemetry)
{
}

void ServiceLocator::setTelemetrySink(std::shared_ptr<TelemetrySink> sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_telemetry = sink ? std::move(sink) : m_nullTelemetry;
}

std::shared_ptr<TelemetrySink> ServiceLocator::telemetrySink() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_telemetry;
}

void ServiceLocator::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_telemetry = m_nullTelemetry;
}
