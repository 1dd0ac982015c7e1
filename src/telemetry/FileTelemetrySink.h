#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "config/AppConfig.h"
#include "telemetry/TelemetrySink.h"

// Appends events as JSON lines to session_<timestamp>_<seq>.jsonl files in the
// configured directory. A file past rotationBytes is closed and a new one
// opened; only the newest retentionFiles sessions are kept. Events that cannot
// be written go to the fallback sink.
class FileTelemetrySink : public TelemetrySink
{
  public:
    FileTelemetrySink(const TelemetryConfig &config, std::shared_ptr<TelemetrySink> fallback);
    ~FileTelemetrySink() override;

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

    std::filesystem::path currentFile() const;

  private:
    bool openLocked();
    void closeLocked();
    bool writeLocked(const std::string &line);
    void pruneLocked();
    void fallbackLocked(std::string_view eventName, const Payload &payload);

    const std::filesystem::path m_directory;
    const std::uintmax_t m_rotationBytes;
    const std::size_t m_retentionFiles;
    std::shared_ptr<TelemetrySink> m_fallback;

    mutable std::mutex m_mutex;
    std::ofstream m_stream;
    std::filesystem::path m_currentFile;
    std::uintmax_t m_bytesWritten = 0;
    std::uint64_t m_sequence = 0;
};
