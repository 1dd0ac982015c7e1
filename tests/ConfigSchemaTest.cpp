#include "config/AppConfigLoader.h"

#include <filesystem>
#include <fstream>
#include <iostream>

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

bool shippedConfigIsValid()
{
    bool success = true;
    std::filesystem::path root = std::filesystem::path(PROJECT_SOURCE_DIR);
    AppConfigLoader loader(root / "config");
    auto result = loader.load();
    if (!result.success)
    {
        std::cerr << "Config schema validation failed:\n";
        for (const auto &error : result.errors)
        {
            std::cerr << "  " << error.file << ": " << error.message << '\n';
        }
        return false;
    }

    const AppConfig &config = result.config;
    success &= assertTrue(config.window.minWidth == 1280 && config.window.minHeight == 720, "Minimum window must be 1280x720");
    success &= assertTrue(config.framePacing.thresholdSeconds > 0.0 && config.framePacing.sleepSeconds > 0.0,
                          "Frame pacing must be enabled");
    success &= assertTrue(config.performance.inputMs > 0.0f && config.performance.renderMs > 0.0f &&
                              config.performance.commandMs > 0.0f,
                          "Performance budgets must be positive");
    success &= assertTrue(config.input.snapInterval == 6, "Snap interval must be six inches");
    success &= assertTrue(config.messages.durationMs == 5000, "Messages must last five seconds");
    return success;
}

bool invalidConfigIsReported()
{
    bool success = true;
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "floorsketch_config_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "app.json") << R"({"schema_version": 2})";
    std::ofstream(dir / "input.json") << R"({"schema_version": 1, "bindings": {"quit": "Ctrl+NoSuchKey"}, "snapInterval": 0})";

    AppConfigLoader loader(dir);
    auto result = loader.load();
    success &= assertTrue(!result.success, "Invalid config must fail");
    success &= assertTrue(result.errors.size() == 3, "Schema, binding and snap errors must each be reported");
    success &= assertTrue(result.config.input.quit == InputBindings{}.quit, "Rejected bindings keep their defaults");
    success &= assertTrue(result.config.input.snapInterval == 6, "Rejected snap interval keeps its default");

    std::filesystem::remove_all(dir);
    AppConfigLoader missing(dir);
    auto missingResult = missing.load();
    success &= assertTrue(!missingResult.success && missingResult.errors.size() == 2, "Missing files must be reported");
    success &= assertTrue(missingResult.config.framePacing.thresholdSeconds == FramePacingConfig{}.thresholdSeconds,
                          "Missing files leave defaults in place");
    return success;
}

bool nonIntegralNumbersAreRejected()
{
    bool success = true;
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "floorsketch_config_numbers_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "app.json") << R"({"schema_version": 1e300, "window": {"width": 1.5}})";
    std::ofstream(dir / "input.json") << R"({"schema_version": 1.0, "bindings": {}, "snapInterval": 1e300})";

    AppConfigLoader loader(dir);
    auto result = loader.load();
    success &= assertTrue(result.errors.size() == 1, "Only the out-of-range schema_version must be reported");
    success &= assertTrue(result.config.input.snapInterval == 6, "An out-of-range snap interval keeps its default");

    std::ofstream(dir / "app.json", std::ios::trunc) << R"({"schema_version": 1, "window": {"width": 1.5}})";
    auto windowResult = AppConfigLoader(dir).load();
    success &= assertTrue(windowResult.config.window.width == WindowConfig{}.width, "A fractional width keeps its default");

    std::filesystem::remove_all(dir);
    return success;
}

} // namespace

int main()
{
    bool success = true;
    success &= shippedConfigIsValid();
    success &= invalidConfigIsReported();
    success &= nonIntegralNumbersAreRejected();
    if (!success)
    {
        std::cerr << "ConfigSchemaTest failed\n";
        return 1;
    }
    return 0;
}
