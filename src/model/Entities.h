#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

struct Point
{
    int x = 0;
    int y = 0;
};

inline bool operator==(const Point &a, const Point &b)
{
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point &a, const Point &b)
{
    return !(a == b);
}

inline bool operator<(const Point &a, const Point &b)
{
    return std::tie(a.x, a.y) < std::tie(b.x, b.y);
}

struct Color
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

enum class LineType : std::uint8_t
{
    ExteriorWall = 0,
    InteriorWall,
    Measurement
};

const char *lineTypeToString(LineType type);
std::optional<LineType> lineTypeFromString(const std::string &id);

// Drawing thickness in inches; one pixel is one inch at unit zoom.
int lineThickness(LineType type);

struct Line
{
    std::uint64_t id = 0;
    LineType type = LineType::ExteriorWall;
    Point start;
    Point end;
    Color color;

    double length() const;
};

struct UserText
{
    std::string text;
    Point position;
};

// "<feet> ft <inches> in" for a length in inches; sign is ignored.
std::string formatFeetInches(double inches);
