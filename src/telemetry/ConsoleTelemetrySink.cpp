#include "telemetry/ConsoleTelemetrySink.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace
{
std::string currentTimestamp()
{
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const std::time_t time = clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}
} // namespace

ConsoleTelemetrySink::ConsoleTelemetrySink() : m_stream(std::cout) {}

ConsoleTelemetrySink::ConsoleTelemetrySink(std::ostream &stream) : m_stream(stream) {}

void ConsoleTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    std::vector<std::pair<std::string, std::string>> entries(payload.begin(), payload.end());
    std::sort(entries.begin(), entries.end());

    std::ostringstream line;
    line << "[telemetry] time=" << currentTimestamp() << " event=" << eventName;
    for (const auto &entry : entries)
    {
        line << ' ' << entry.first << '=' << entry.second;
    }
    line << '\n';

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream << line.str();
}

void ConsoleTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.flush();
}
