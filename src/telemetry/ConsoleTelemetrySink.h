#pragma once

#include <mutex>
#include <ostream>

#include "telemetry/TelemetrySink.h"

// Writes one timestamped line per event. The stream defaults to stdout.
class ConsoleTelemetrySink : public TelemetrySink
{
  public:
    ConsoleTelemetrySink();
    explicit ConsoleTelemetrySink(std::ostream &stream);

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

  private:
    std::mutex m_mutex;
    std::ostream &m_stream;
};
