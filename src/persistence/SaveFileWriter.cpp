#include "persistence/SaveFileWriter.h"

#include "json/JsonUtils.h"
#include "model/Model.h"
#include "persistence/SaveFileLoader.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace
{

void writePoint(std::ostream &out, const Point &point)
{
    out << '[' << point.x << ", " << point.y << ']';
}

} // namespace

std::string SaveFileWriter::serialize(const Model &model)
{
    std::ostringstream out;
    out << "{\n  \"schema_version\": " << SaveFileLoader::kSchemaVersion << ",\n  \"lines\": [";
    bool first = true;
    for (const Line &line : model.lines())
    {
        out << (first ? "\n" : ",\n") << "    {\"type\": " << json::quote(lineTypeToString(line.type)) << ", \"start\": ";
        writePoint(out, line.start);
        out << ", \"end\": ";
        writePoint(out, line.end);
        out << ", \"color\": [" << static_cast<int>(line.color.r) << ", " << static_cast<int>(line.color.g) << ", "
            << static_cast<int>(line.color.b) << "]}";
        first = false;
    }
    out << (first ? "]" : "\n  ]") << ",\n  \"text\": [";
    first = true;
    for (const UserText &text : model.userText())
    {
        out << (first ? "\n" : ",\n") << "    {\"text\": " << json::quote(text.text) << ", \"position\": ";
        writePoint(out, text.position);
        out << '}';
        first = false;
    }
    out << (first ? "]" : "\n  ]") << "\n}\n";
    return out.str();
}

SaveWriteResult SaveFileWriter::write(const Model &model, const fs::path &path) const
{
    SaveWriteResult result;
    if (path.empty())
    {
        result.error = "empty filename";
        return result;
    }

    const fs::path parent = path.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            result.error = "cannot create directory: " + ec.message();
            return result;
        }
    }

    std::ofstream stream(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream.is_open())
    {
        result.error = "failed to open for writing";
        return result;
    }
    stream << serialize(model);
    stream.flush();
    if (!stream.good())
    {
        result.error = "write failed";
        return result;
    }

    result.success = true;
    return result;
}

fs::path nextSaveFilename(const fs::path &directory)
{
    std::size_t existing = 0;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && it->path().extension() == ".sav")
        {
            ++existing;
        }
    }
    fs::path candidate = directory / ("save" + std::to_string(existing + 1) + ".sav");
    while (fs::exists(candidate, ec))
    {
        candidate = directory / ("save" + std::to_string(++existing + 1) + ".sav");
    }
    return candidate;
}
