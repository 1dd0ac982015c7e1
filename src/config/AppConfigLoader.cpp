#include "config/AppConfigLoader.h"

#include <algorithm>
#include <optional>
#include <utility>

#include "input/InputMapper.h"
#include "json/JsonUtils.h"

namespace fs = std::filesystem;

namespace
{

constexpr int kAppSchemaVersion = 1;
constexpr int kInputSchemaVersion = 1;

AppConfigLoadError makeError(const fs::path &path, std::string message)
{
    AppConfigLoadError error;
    error.file = path.lexically_normal().string();
    error.message = std::move(message);
    return error;
}

std::optional<json::JsonValue> readLocalJson(const fs::path &path, std::vector<AppConfigLoadError> &errors)
{
    std::string reason;
    auto parsed = json::readJsonFile(path.string(), reason);
    if (!parsed)
    {
        errors.push_back(makeError(path, reason));
        return std::nullopt;
    }
    if (!parsed->isObject())
    {
        errors.push_back(makeError(path, "Root must be an object"));
        return std::nullopt;
    }
    return parsed;
}

bool validateSchema(const json::JsonValue &root, int expected, const fs::path &path, std::vector<AppConfigLoadError> &errors)
{
    const json::JsonValue *schemaValue = json::getObjectField(root, "schema_version");
    if (!schemaValue || schemaValue->type != json::JsonValue::Type::Number)
    {
        errors.push_back(makeError(path, "Missing schema_version"));
        return false;
    }
    int schema = 0;
    if (!json::toInt(schemaValue->number, schema) || schema != expected)
    {
        errors.push_back(makeError(path, "schema_version mismatch"));
        return false;
    }
    return true;
}

void parseWindow(const json::JsonValue &root, const fs::path &path, WindowConfig &window, std::vector<AppConfigLoadError> &errors)
{
    const json::JsonValue *node = json::getObjectField(root, "window");
    if (!node)
    {
        return;
    }
    window.title = json::getString(*node, "title", window.title);
    window.width = json::getInt(*node, "width", window.width);
    window.height = json::getInt(*node, "height", window.height);
    window.minWidth = json::getInt(*node, "minWidth", window.minWidth);
    window.minHeight = json::getInt(*node, "minHeight", window.minHeight);
    if (window.width <= 0 || window.height <= 0)
    {
        errors.push_back(makeError(path, "window size must be positive"));
        window.width = WindowConfig{}.width;
        window.height = WindowConfig{}.height;
    }
}

void parseFonts(const json::JsonValue &root, FontConfig &fonts)
{
    if (const json::JsonValue *node = json::getObjectField(root, "fonts"))
    {
        fonts.uiPath = json::getString(*node, "ui", fonts.uiPath);
        fonts.smallSize = std::max(1, json::getInt(*node, "smallSize", fonts.smallSize));
        fonts.largeSize = std::max(1, json::getInt(*node, "largeSize", fonts.largeSize));
    }
}

void parseFramePacing(const json::JsonValue &root,
                      const fs::path &path,
                      FramePacingConfig &pacing,
                      std::vector<AppConfigLoadError> &errors)
{
    const json::JsonValue *node = json::getObjectField(root, "framePacing");
    if (!node)
    {
        return;
    }
    const float thresholdMs = json::getNumber(*node, "thresholdMs", static_cast<float>(pacing.thresholdSeconds * 1000.0));
    const float sleepMs = json::getNumber(*node, "sleepMs", static_cast<float>(pacing.sleepSeconds * 1000.0));
    if (thresholdMs < 0.0f || sleepMs < 0.0f)
    {
        errors.push_back(makeError(path, "framePacing values must not be negative"));
        return;
    }
    pacing.thresholdSeconds = static_cast<double>(thresholdMs) / 1000.0;
    pacing.sleepSeconds = static_cast<double>(sleepMs) / 1000.0;
}

void parsePerformance(const json::JsonValue &root, PerformanceBudgetConfig &budget)
{
    if (const json::JsonValue *node = json::getObjectField(root, "performance"))
    {
        budget.inputMs = json::getNumber(*node, "inputMs", budget.inputMs);
        budget.renderMs = json::getNumber(*node, "renderMs", budget.renderMs);
        budget.commandMs = json::getNumber(*node, "commandMs", budget.commandMs);
        budget.toleranceMs = json::getNumber(*node, "toleranceMs", budget.toleranceMs);
    }
}

void parseTelemetry(const json::JsonValue &root, TelemetryConfig &telemetry)
{
    if (const json::JsonValue *node = json::getObjectField(root, "telemetry"))
    {
        telemetry.directory = json::getString(*node, "directory", telemetry.directory);
        const int rotation = json::getInt(*node, "rotationBytes", static_cast<int>(telemetry.rotationBytes));
        telemetry.rotationBytes = rotation > 0 ? static_cast<std::uintmax_t>(rotation) : 0;
        const int retention = json::getInt(*node, "retentionFiles", static_cast<int>(telemetry.retentionFiles));
        telemetry.retentionFiles = retention > 0 ? static_cast<std::size_t>(retention) : 0;
        telemetry.console = json::getBool(*node, "console", telemetry.console);
    }
}

void parseSaves(const json::JsonValue &root, SaveConfig &saves, MessageConfig &messages)
{
    if (const json::JsonValue *node = json::getObjectField(root, "saves"))
    {
        saves.directory = json::getString(*node, "directory", saves.directory);
        saves.exportFile = json::getString(*node, "exportFile", saves.exportFile);
    }
    if (const json::JsonValue *node = json::getObjectField(root, "messages"))
    {
        const int duration = json::getInt(*node, "durationMs", static_cast<int>(messages.durationMs));
        messages.durationMs = duration > 0 ? static_cast<std::uint32_t>(duration) : messages.durationMs;
    }
}

void readBinding(const json::JsonValue &bindings,
                 const char *key,
                 std::string &target,
                 const fs::path &path,
                 std::vector<AppConfigLoadError> &errors)
{
    const json::JsonValue *value = json::getObjectField(bindings, key);
    if (!value)
    {
        return;
    }
    if (value->type != json::JsonValue::Type::String)
    {
        errors.push_back(makeError(path, std::string("binding '") + key + "' must be a string"));
        return;
    }
    if (!InputMapper::isValidBinding(value->string))
    {
        errors.push_back(makeError(path, std::string("binding '") + key + "' is not a known key: " + value->string));
        return;
    }
    target = value->string;
}

void parseInput(const json::JsonValue &root, const fs::path &path, InputBindings &input, std::vector<AppConfigLoadError> &errors)
{
    const json::JsonValue *bindings = json::getObjectField(root, "bindings");
    if (!bindings || !bindings->isObject())
    {
        errors.push_back(makeError(path, "Missing bindings"));
    }
    else
    {
        readBinding(*bindings, "quit", input.quit, path, errors);
        readBinding(*bindings, "save", input.save, path, errors);
        readBinding(*bindings, "export", input.exportDrawing, path, errors);
        readBinding(*bindings, "drawExteriorWall", input.drawExteriorWall, path, errors);
        readBinding(*bindings, "drawInteriorWall", input.drawInteriorWall, path, errors);
        readBinding(*bindings, "measure", input.measure, path, errors);
        readBinding(*bindings, "cancel", input.cancel, path, errors);
        readBinding(*bindings, "toggleGrid", input.toggleGrid, path, errors);
        readBinding(*bindings, "placePoint", input.placePoint, path, errors);
        readBinding(*bindings, "addText", input.addText, path, errors);
        readBinding(*bindings, "confirmText", input.confirmText, path, errors);
        readBinding(*bindings, "eraseText", input.eraseText, path, errors);
        readBinding(*bindings, "resetCamera", input.resetCamera, path, errors);
        readBinding(*bindings, "pan", input.pan, path, errors);
    }

    const int snap = json::getInt(root, "snapInterval", input.snapInterval);
    if (snap <= 0)
    {
        errors.push_back(makeError(path, "snapInterval must be positive"));
    }
    else
    {
        input.snapInterval = snap;
    }
    input.bufferFrames = std::max(1, json::getInt(root, "bufferFrames", input.bufferFrames));
    input.bufferExpiryMs = std::max(0.0f, json::getNumber(root, "bufferExpiryMs", input.bufferExpiryMs));
}

} // namespace

AppConfigLoader::AppConfigLoader(std::filesystem::path configRoot) : m_configRoot(std::move(configRoot)) {}

AppConfigLoadResult AppConfigLoader::load() const
{
    AppConfigLoadResult result;
    AppConfig &config = result.config;

    const fs::path appPath = m_configRoot / "app.json";
    if (auto root = readLocalJson(appPath, result.errors))
    {
        if (validateSchema(*root, kAppSchemaVersion, appPath, result.errors))
        {
            parseWindow(*root, appPath, config.window, result.errors);
            parseFonts(*root, config.fonts);
            parseFramePacing(*root, appPath, config.framePacing, result.errors);
            parsePerformance(*root, config.performance);
            parseTelemetry(*root, config.telemetry);
            parseSaves(*root, config.saves, config.messages);
        }
    }

    const fs::path inputPath = m_configRoot / "input.json";
    if (auto root = readLocalJson(inputPath, result.errors))
    {
        if (validateSchema(*root, kInputSchemaVersion, inputPath, result.errors))
        {
            parseInput(*root, inputPath, config.input, result.errors);
        }
    }

    result.success = result.errors.empty();
    return result;
}
