#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

// Receives named events with string key/value payloads. Implementations must be
// safe to call from the background thread as well as the frame loop.
class TelemetrySink
{
  public:
    using Payload = std::unordered_map<std::string, std::string>;

    virtual ~TelemetrySink() = default;

    virtual void recordEvent(std::string_view eventName, const Payload &payload) = 0;
    virtual void flush() {}
};

class NullTelemetrySink : public TelemetrySink
{
  public:
    void recordEvent(std::string_view, const Payload &) override {}
};

// Null-safe shorthand used by code that holds an optional sink.
void recordTelemetry(const std::shared_ptr<TelemetrySink> &sink,
                     std::string_view eventName,
                     const TelemetrySink::Payload &payload = {});
