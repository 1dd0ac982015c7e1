#include "telemetry/FileTelemetrySink.h"

#include "json/JsonUtils.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{
constexpr const char *kSessionPrefix = "session_";
constexpr const char *kSessionExtension = ".jsonl";

std::string sessionFileName(std::uint64_t sequence)
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream name;
    name << kSessionPrefix << std::put_time(&local, "%Y%m%d_%H%M%S") << '_' << std::setw(4) << std::setfill('0')
         << sequence << kSessionExtension;
    return name.str();
}

bool isSessionFile(const fs::directory_entry &entry)
{
    std::error_code ec;
    const fs::path &path = entry.path();
    return entry.is_regular_file(ec) && path.extension() == kSessionExtension &&
           path.filename().string().rfind(kSessionPrefix, 0) == 0;
}

// One JSON object per line, keys sorted so lines diff cleanly.
std::string jsonLine(std::string_view eventName, const TelemetrySink::Payload &payload)
{
    const std::map<std::string, std::string> sorted(payload.begin(), payload.end());
    std::string line = "{\"event\":" + json::quote(eventName);
    for (const auto &[key, value] : sorted)
    {
        line += ',' + json::quote(key) + ':' + json::quote(value);
    }
    line += "}\n";
    return line;
}
} // namespace

FileTelemetrySink::FileTelemetrySink(const TelemetryConfig &config, std::shared_ptr<TelemetrySink> fallback)
    : m_directory(config.directory.empty() ? fs::path("logs") : fs::path(config.directory)),
      m_rotationBytes(config.rotationBytes),
      m_retentionFiles(config.retentionFiles),
      m_fallback(std::move(fallback))
{
}

FileTelemetrySink::~FileTelemetrySink()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    closeLocked();
}

void FileTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_stream.is_open() && !openLocked())
    {
        fallbackLocked(eventName, payload);
        return;
    }
    if (!writeLocked(jsonLine(eventName, payload)))
    {
        fallbackLocked(eventName, payload);
        return;
    }
    if (m_rotationBytes > 0 && m_bytesWritten >= m_rotationBytes)
    {
        const fs::path previous = m_currentFile;
        closeLocked();
        if (openLocked())
        {
            writeLocked(jsonLine("telemetry.rotation", Payload{{"previous", previous.lexically_normal().string()}}));
        }
    }
}

void FileTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stream.is_open())
    {
        m_stream.flush();
    }
    if (m_fallback)
    {
        m_fallback->flush();
    }
}

fs::path FileTelemetrySink::currentFile() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentFile;
}

bool FileTelemetrySink::openLocked()
{
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    std::error_code dirEc;
    if (ec && !fs::is_directory(m_directory, dirEc))
    {
        fallbackLocked("telemetry.directory_unavailable",
                       Payload{{"path", m_directory.lexically_normal().string()}, {"error", ec.message()}});
        return false;
    }

    pruneLocked();
    const fs::path path = m_directory / sessionFileName(++m_sequence);
    m_stream.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!m_stream.is_open())
    {
        m_stream.clear();
        fallbackLocked("telemetry.log_open_failed", Payload{{"path", path.lexically_normal().string()}});
        return false;
    }
    m_currentFile = path;
    m_bytesWritten = 0;
    return true;
}

void FileTelemetrySink::closeLocked()
{
    if (m_stream.is_open())
    {
        m_stream.close();
    }
    m_stream.clear();
    m_currentFile.clear();
    m_bytesWritten = 0;
}

bool FileTelemetrySink::writeLocked(const std::string &line)
{
    m_stream << line;
    if (!m_stream.good())
    {
        const fs::path failed = m_currentFile;
        closeLocked();
        fallbackLocked("telemetry.write_failed", Payload{{"file", failed.lexically_normal().string()}});
        return false;
    }
    m_bytesWritten += line.size();
    return true;
}

// Makes room for one more session file.
void FileTelemetrySink::pruneLocked()
{
    if (m_retentionFiles == 0)
    {
        return;
    }
    std::error_code ec;
    std::vector<fs::path> sessions;
    for (const auto &entry : fs::directory_iterator(m_directory, ec))
    {
        if (isSessionFile(entry))
        {
            sessions.push_back(entry.path());
        }
    }
    if (ec || sessions.size() < m_retentionFiles)
    {
        return;
    }

    // Names embed timestamp then sequence, so lexical order is age order.
    std::sort(sessions.begin(), sessions.end());
    const std::size_t excess = sessions.size() - (m_retentionFiles - 1);
    for (std::size_t i = 0; i < excess; ++i)
    {
        std::error_code removeEc;
        if (!fs::remove(sessions[i], removeEc) && removeEc)
        {
            fallbackLocked("telemetry.prune_failed",
                           Payload{{"path", sessions[i].lexically_normal().string()}, {"error", removeEc.message()}});
        }
    }
}

void FileTelemetrySink::fallbackLocked(std::string_view eventName, const Payload &payload)
{
    if (m_fallback)
    {
        m_fallback->recordEvent(eventName, payload);
    }
}
