#include <SDL.h>

#include "app/SdlView.h"
#include "app/SketchApplication.h"
#include "config/AppConfig.h"
#include "config/AppConfigLoader.h"
#include "controller/InteractiveController.h"
#include "services/ServiceLocator.h"
#include "telemetry/ConsoleTelemetrySink.h"
#include "telemetry/FileTelemetrySink.h"
#include "telemetry/TelemetrySink.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace
{

std::shared_ptr<TelemetrySink> createTelemetrySink(const TelemetryConfig &config,
                                                   const std::optional<std::filesystem::path> &directoryOverride)
{
    auto console = std::make_shared<ConsoleTelemetrySink>();
    if (config.console)
    {
        return console;
    }
    TelemetryConfig fileConfig = config;
    if (directoryOverride)
    {
        fileConfig.directory = directoryOverride->string();
    }
    return std::make_shared<FileTelemetrySink>(fileConfig, console);
}

} // namespace

int main(int argc, char **argv)
{
    std::optional<std::filesystem::path> telemetryDir;
    std::string loadFilename;
    constexpr std::string_view kTelemetryPrefix{"--telemetry-dir="};
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg.substr(0, kTelemetryPrefix.size()) == kTelemetryPrefix)
        {
            telemetryDir = std::filesystem::path(std::string(arg.substr(kTelemetryPrefix.size())));
        }
        else if (loadFilename.empty())
        {
            loadFilename = std::string(arg);
        }
        else
        {
            std::cerr << "usage: floorsketch [--telemetry-dir=<dir>] [savefile]\n";
            return 2;
        }
    }

    const AppConfigLoader configLoader(std::filesystem::absolute("config"));
    const AppConfigLoadResult configResult = configLoader.load();
    for (const AppConfigLoadError &error : configResult.errors)
    {
        std::cerr << "[config] " << error.file << ": " << error.message << '\n';
    }
    const AppConfig &config = configResult.config;

    auto telemetry = createTelemetrySink(config.telemetry, telemetryDir);
    ServiceLocator::instance().setTelemetrySink(telemetry);
    if (!configResult.success)
    {
        recordTelemetry(telemetry, "app.config.errors",
                        TelemetrySink::Payload{{"count", std::to_string(configResult.errors.size())}});
    }

    auto view = std::make_unique<SdlView>();
    if (!view->initialize(config))
    {
        telemetry->flush();
        return 1;
    }
    auto controller = std::make_unique<InteractiveController>(config);

    SketchApplication app(std::move(view), std::move(controller), loadFilename);
    app.setFramePacing(config.framePacing);
    app.setPerformanceBudget(config.performance);
    const bool ran = app.run();

    telemetry->flush();
    ServiceLocator::instance().clear();
    return ran ? 0 : 1;
}
