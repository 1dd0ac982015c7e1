#include "telemetry/TelemetrySink.h"

void recordTelemetry(const std::shared_ptr<TelemetrySink> &sink,
                     std::string_view eventName,
                     const TelemetrySink::Payload &payload)
{
    if (sink)
    {
        sink->recordEvent(eventName, payload);
    }
}
