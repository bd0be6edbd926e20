// Config.hpp
#pragma once

#include <optional>
#include <string>

struct lua_State;

// Settings read from the Lua globals set by jotter.lua.
struct EditorConfig
{
    std::string fontPath;
    float fontSize = 16.0f;
    bool showLineNumbers = true;
    bool darkTheme = true;
    std::optional<std::string> startupFile;
    int windowWidth = 1280;
    int windowHeight = 720;

    // Keeps the defaults for globals that are missing or of the wrong type.
    static EditorConfig fromLua(lua_State* L);
};
