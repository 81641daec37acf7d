#pragma once

#include <map>
#include <string>

namespace sdbsplit
{

enum class Color
{
    Red,
    Green,
    Yellow,
    Cyan
};

inline std::string color(const std::string& s, Color c)
{
    static const std::map<Color, std::string> colorCodes {
        { Color::Red,       "\x1b[31m" },
        { Color::Green,     "\x1b[32m" },
        { Color::Yellow,    "\x1b[33m" },
        { Color::Cyan,      "\x1b[36m" }
    };

    return colorCodes.at(c) + s + "\x1b[0m";
}

} // namespace sdbsplit
