#include "services/ServiceLocator.h"
#include "telemetry/ConsoleTelemetrySink.h"
#include "telemetry/FileTelemetrySink.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace
{

bool assertTrue(bool condition, const char *message)
{
    if (!condition)
    {
        std::cerr << message << '\n';
        return false;
    }
    return true;
}

bool consoleSinkWritesSortedPayload()
{
    std::ostringstream out;
    ConsoleTelemetrySink sink(out);
    sink.recordEvent("app.load.failed", {{"reason", "bad json"}, {"file", "plan.sav"}});
    const std::string line = out.str();
    bool success = true;
    success &= assertTrue(line.find("event=app.load.failed") != std::string::npos, "Console line must name the event");
    success &= assertTrue(line.find("file=plan.sav reason=bad json") != std::string::npos, "Payload must be sorted by key");
    return success;
}

bool fileSinkWritesJsonLines()
{
    bool success = true;
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "floorsketch_telemetry_test";
    std::filesystem::remove_all(dir);

    std::ostringstream fallbackOut;
    auto fallback = std::make_shared<ConsoleTelemetrySink>(fallbackOut);
    {
        TelemetryConfig config;
        config.directory = dir.string();
        FileTelemetrySink sink(config, fallback);
        sink.recordEvent("app.run.started", {});
        sink.recordEvent("app.load.failed", {{"file", "quote\"d.sav"}});
        sink.flush();

        const std::filesystem::path file = sink.currentFile();
        success &= assertTrue(file.parent_path() == dir, "Log file must live in the output directory");
        success &= assertTrue(file.extension() == ".jsonl", "Log file must be JSON lines");

        std::ifstream in(file);
        const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        success &= assertTrue(contents.find("app.run.started") != std::string::npos, "First event must be written");
        success &= assertTrue(contents.find("quote\\\"d.sav") != std::string::npos, "Payload must be JSON escaped");
    }
    success &= assertTrue(fallbackOut.str().empty(), "Fallback must stay unused while the file is writable");

    std::filesystem::remove_all(dir);
    return success;
}

bool fileSinkRotatesAndPrunes()
{
    bool success = true;
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "floorsketch_telemetry_rotation_test";
    std::filesystem::remove_all(dir);

    std::ostringstream fallbackOut;
    auto fallback = std::make_shared<ConsoleTelemetrySink>(fallbackOut);
    {
        TelemetryConfig config;
        config.directory = dir.string();
        config.rotationBytes = 1;
        config.retentionFiles = 2;
        FileTelemetrySink sink(config, fallback);
        std::filesystem::path first;
        for (int i = 0; i < 5; ++i)
        {
            sink.recordEvent("frame.budget_exceeded", {{"stage", "render"}});
            if (i == 0)
            {
                first = sink.currentFile();
            }
        }
        success &= assertTrue(sink.currentFile() != first, "A full log file must be rotated");
    }

    std::size_t sessions = 0;
    for (const auto &entry : std::filesystem::directory_iterator(dir))
    {
        sessions += entry.path().extension() == ".jsonl" ? 1 : 0;
    }
    success &= assertTrue(sessions == 2, "Only the newest sessions may be kept");
    success &= assertTrue(fallbackOut.str().empty(), "Rotation must not fall back to the console");

    std::filesystem::remove_all(dir);
    return success;
}

bool locatorFallsBackToNullSink()
{
    bool success = true;
    ServiceLocator &locator = ServiceLocator::instance();
    locator.clear();
    success &= assertTrue(locator.telemetrySink() != nullptr, "Locator must always provide a sink");

    auto console = std::make_shared<ConsoleTelemetrySink>();
    locator.setTelemetrySink(console);
    success &= assertTrue(locator.telemetrySink() == console, "Registered sink must be returned");
    locator.setTelemetrySink(nullptr);
    success &= assertTrue(locator.telemetrySink() != console, "Clearing the sink must restore the null sink");
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= consoleSinkWritesSortedPayload();
    success &= fileSinkWritesJsonLines();
    success &= fileSinkRotatesAndPrunes();
    success &= locatorFallsBackToNullSink();
    if (!success)
    {
        std::cerr << "TelemetrySinkTest failed\n";
        return 1;
    }
    return 0;
}
