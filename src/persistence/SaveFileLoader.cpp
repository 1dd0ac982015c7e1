#include "persistence/SaveFileLoader.h"

#include "json/JsonUtils.h"
#include "model/Model.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

SaveLoadResult failure(std::string message)
{
    SaveLoadResult result;
    result.success = false;
    result.error = std::move(message);
    return result;
}

std::optional<Point> readPoint(const json::JsonValue &node, const std::string &key)
{
    auto values = json::getIntTuple(node, key, 2);
    if (!values)
    {
        return std::nullopt;
    }
    return Point{(*values)[0], (*values)[1]};
}

std::optional<Color> readColor(const json::JsonValue &node)
{
    if (!json::getObjectField(node, "color"))
    {
        return Color{};
    }
    auto values = json::getIntTuple(node, "color", 3);
    if (!values)
    {
        return std::nullopt;
    }
    for (int channel : *values)
    {
        if (channel < 0 || channel > 255)
        {
            return std::nullopt;
        }
    }
    return Color{static_cast<std::uint8_t>((*values)[0]), static_cast<std::uint8_t>((*values)[1]),
                 static_cast<std::uint8_t>((*values)[2])};
}

} // namespace

SaveLoadResult SaveFileLoader::load(Model &model, const std::filesystem::path &path) const
{
    if (path.empty())
    {
        return failure("empty filename");
    }

    std::string reason;
    auto root = json::readJsonFile(path.string(), reason);
    if (!root)
    {
        return failure(reason);
    }
    if (!root->isObject())
    {
        return failure("root must be an object");
    }
    if (json::getInt(*root, "schema_version", 0) != kSchemaVersion)
    {
        return failure("unsupported schema_version");
    }

    model.clear();

    if (const json::JsonValue *lines = json::getObjectField(*root, "lines"))
    {
        if (!lines->isArray())
        {
            return failure("'lines' must be an array");
        }
        std::size_t index = 0;
        for (const json::JsonValue &node : lines->array)
        {
            const auto type = lineTypeFromString(json::getString(node, "type", ""));
            const auto start = readPoint(node, "start");
            const auto end = readPoint(node, "end");
            const auto color = readColor(node);
            if (!type || !start || !end || !color)
            {
                return failure("malformed line at index " + std::to_string(index));
            }
            model.addLine(*type, *start, *end, *color);
            ++index;
        }
    }

    if (const json::JsonValue *texts = json::getObjectField(*root, "text"))
    {
        if (!texts->isArray())
        {
            return failure("'text' must be an array");
        }
        std::size_t index = 0;
        for (const json::JsonValue &node : texts->array)
        {
            const json::JsonValue *content = json::getObjectField(node, "text");
            const auto position = readPoint(node, "position");
            if (!content || !content->isString() || !position)
            {
                return failure("malformed text at index " + std::to_string(index));
            }
            model.addUserText(UserText{content->string, *position});
            ++index;
        }
    }

    model.setUpdateNeeded(true);

    SaveLoadResult result;
    result.success = true;
    return result;
}
