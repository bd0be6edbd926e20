// Config.cpp
#include "Config.hpp"
#include <algorithm>

extern "C"
{
#include <lua.h>
}

namespace
{
// larger values are clamped before narrowing
constexpr double kMaxWindowExtent = 16384.0;
constexpr double kMaxFontSize = 256.0;

std::optional<std::string> globalString(lua_State* L, const char* name)
{
    std::optional<std::string> value;
    lua_getglobal(L, name);
    if (lua_type(L, -1) == LUA_TSTRING)
        value = lua_tostring(L, -1);
    lua_pop(L, 1);
    return value;
}

std::optional<double> globalNumber(lua_State* L, const char* name)
{
    std::optional<double> value;
    lua_getglobal(L, name);
    if (lua_type(L, -1) == LUA_TNUMBER)
        value = lua_tonumber(L, -1);
    lua_pop(L, 1);
    return value;
}

std::optional<bool> globalBool(lua_State* L, const char* name)
{
    std::optional<bool> value;
    lua_getglobal(L, name);
    if (lua_type(L, -1) == LUA_TBOOLEAN)
        value = lua_toboolean(L, -1) != 0;
    lua_pop(L, 1);
    return value;
}
} // namespace

EditorConfig EditorConfig::fromLua(lua_State* L)
{
    EditorConfig config;

    if (auto font = globalString(L, "font_path"))
        config.fontPath = *font;
    if (auto size = globalNumber(L, "font_size"); size && *size > 0.0)
        config.fontSize = (float)std::min(*size, kMaxFontSize);
    if (auto lineNumbers = globalBool(L, "show_line_numbers"))
        config.showLineNumbers = *lineNumbers;
    if (auto theme = globalString(L, "theme"))
        config.darkTheme = *theme != "light";
    if (auto startup = globalString(L, "startup_file"); startup && !startup->empty())
        config.startupFile = *startup;
    if (auto width = globalNumber(L, "window_width"); width && *width >= 200.0)
        config.windowWidth = (int)std::min(*width, kMaxWindowExtent);
    if (auto height = globalNumber(L, "window_height"); height && *height >= 150.0)
        config.windowHeight = (int)std::min(*height, kMaxWindowExtent);

    return config;
}
