#include "model/Entities.h"

#include <cmath>

const char *lineTypeToString(LineType type)
{
    switch (type)
    {
    case LineType::ExteriorWall:
        return "exterior";
    case LineType::InteriorWall:
        return "interior";
    case LineType::Measurement:
        return "measurement";
    }
    return "exterior";
}

std::optional<LineType> lineTypeFromString(const std::string &id)
{
    if (id == "exterior")
    {
        return LineType::ExteriorWall;
    }
    if (id == "interior")
    {
        return LineType::InteriorWall;
    }
    if (id == "measurement")
    {
        return LineType::Measurement;
    }
    return std::nullopt;
}

int lineThickness(LineType type)
{
    switch (type)
    {
    case LineType::ExteriorWall:
        return 6;
    case LineType::InteriorWall:
        return 4;
    case LineType::Measurement:
        return 1;
    }
    return 1;
}

double Line::length() const
{
    const double dx = static_cast<double>(end.x - start.x);
    const double dy = static_cast<double>(end.y - start.y);
    return std::sqrt(dx * dx + dy * dy);
}

std::string formatFeetInches(double inches)
{
    const long total = static_cast<long>(std::fabs(inches));
    const long feet = total / 12;
    const long rest = total - feet * 12;
    return std::to_string(feet) + " ft " + std::to_string(rest) + " in";
}
