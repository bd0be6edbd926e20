#include "LuaBindings.hpp"
#include "Application.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include "imgui.h"

extern "C"
{
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

static Application *appFromUpvalue(lua_State *L)
{
    return static_cast<Application *>(lua_touserdata(L, lua_upvalueindex(1)));
}

static OutputIcon iconFromKey(const char *key)
{
    if (!key)
        return OutputIcon::None;
    std::string k(key);
    if (k == "document")
        return OutputIcon::Document;
    if (k == "folder")
        return OutputIcon::Folder;
    if (k == "save")
        return OutputIcon::Save;
    if (k == "error")
        return OutputIcon::Error;
    if (k == "checkmark")
        return OutputIcon::Checkmark;
    return OutputIcon::None;
}

LuaBindings::LuaBindings(Application *app)
    : app_(app)
{
    initLua();
    registerBridges();
}

LuaBindings::~LuaBindings()
{
    if (L_)
    {
        lua_close(L_);
    }
}

void LuaBindings::initLua()
{
    L_ = luaL_newstate();
    luaL_openlibs(L_);
    eval("package.path = 'plugins/?.lua;' .. package.path");
    eval(R"(
        hooks = { on_render = {} }
        function register_hook(event, fn)
            if hooks[event] then table.insert(hooks[event], fn) end
        end
    )");
}

void LuaBindings::loadPlugins()
{
    std::error_code ec;
    if (!std::filesystem::is_directory("plugins", ec))
        return;

    for (const auto &entry : std::filesystem::directory_iterator("plugins", ec))
    {
        if (entry.is_regular_file() && entry.path().extension() == ".lua")
        {
            loadPluginFile(entry.path().string());
        }
    }
    if (ec)
    {
        app_->addOutput(OutputIcon::Error, "Error reading plugins directory: " + ec.message());
    }
}

bool LuaBindings::eval(const std::string &code)
{
    if (luaL_dostring(L_, code.c_str()))
    {
        app_->addOutput(OutputIcon::Error, std::string("Lua: ") + lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }
    return true;
}

bool LuaBindings::loadScript(const std::string &path)
{
    if (luaL_loadfile(L_, path.c_str()) || lua_pcall(L_, 0, 0, 0))
    {
        app_->addOutput(OutputIcon::Error, "Error running " + path + ": " +
                                               std::string(lua_tostring(L_, -1)));
        lua_pop(L_, 1);
        return false;
    }
    return true;
}

void LuaBindings::loadPluginFile(const std::string &path)
{
    std::string cleanPath = path;
    std::replace(cleanPath.begin(), cleanPath.end(), '\\', '/');

    if (loadScript(path))
    {
        app_->addOutput(OutputIcon::Checkmark, "Loaded plugin: " + cleanPath);
    }
}

bool LuaBindings::runHook(const char *hookName)
{
    std::string code =
        std::string("for _, fn in ipairs(hooks.") + hookName + ") do fn() end";
    return eval(code);
}

// register the c++ <-> lua interactions
void LuaBindings::registerBridges()
{
    auto push_app = [this]()
    {
        lua_pushlightuserdata(L_, app_);
    };

    // print to output window
    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        auto* app = appFromUpvalue(L);
        int n = lua_gettop(L);
        std::string msg;
        for (int i = 1; i <= n; ++i) {
            size_t len;
            const char* s = luaL_tolstring(L, i, &len);
            if (i > 1) msg += " ";
            msg.append(s, len);
            lua_pop(L, 1);
        }
        app->addOutput(msg);
        return 0; }, 1);
    lua_setglobal(L_, "print");

    // print_with_icon(text, icon_key)
    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        auto* app = appFromUpvalue(L);
        const char* text = luaL_checkstring(L, 1);
        const char* iconKey = luaL_optstring(L, 2, nullptr);
        app->addOutput(iconFromKey(iconKey), text);
        return 0; }, 1);
    lua_setglobal(L_, "print_with_icon");

    // editor_new(), editor_open(), editor_save()
    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        appFromUpvalue(L)->dispatch(msg::New{});
        return 0; }, 1);
    lua_setglobal(L_, "editor_new");

    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        appFromUpvalue(L)->dispatch(msg::Open{});
        return 0; }, 1);
    lua_setglobal(L_, "editor_open");

    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        appFromUpvalue(L)->dispatch(msg::Save{});
        return 0; }, 1);
    lua_setglobal(L_, "editor_save");

    // editor_get_text() -> string
    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        std::string text = appFromUpvalue(L)->editor().document().text();
        lua_pushlstring(L, text.data(), text.size());
        return 1; }, 1);
    lua_setglobal(L_, "editor_get_text");

    // editor_get_path() -> string or nil
    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        const auto& path = appFromUpvalue(L)->editor().path();
        if (path)
            lua_pushlstring(L, path->data(), path->size());
        else
            lua_pushnil(L);
        return 1; }, 1);
    lua_setglobal(L_, "editor_get_path");

    // editor_get_cursor_position() -> line, col (1-based, as in the status bar)
    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        auto [line, col] = appFromUpvalue(L)->editor().document().cursorPosition();
        lua_pushinteger(L, line + 1);
        lua_pushinteger(L, col + 1);
        return 2; }, 1);
    lua_setglobal(L_, "editor_get_cursor_position");

    // editor_insert_text(text)
    push_app();
    lua_pushcclosure(L_, [](lua_State *L) -> int
                     {
        size_t len;
        const char* text = luaL_checklstring(L, 1, &len);
        appFromUpvalue(L)->dispatch(msg::Edit{EditAction::insert(std::string(text, len))});
        return 0; }, 1);
    lua_setglobal(L_, "editor_insert_text");

    // ImGui hooks
    lua_newtable(L_);

    // imgui.Text(txt)
    lua_pushcfunction(L_, [](lua_State *L) -> int
                      {
        const char* txt = luaL_checkstring(L, 1);
        ImGui::Text("%s", txt);
        return 0; });
    lua_setfield(L_, -2, "Text");

    // imgui.Button(label) -> bool
    lua_pushcfunction(L_, [](lua_State *L) -> int
                      {
        const char* label = luaL_checkstring(L, 1);
        bool pressed = ImGui::Button(label);
        lua_pushboolean(L, pressed);
        return 1; });
    lua_setfield(L_, -2, "Button");

    // imgui.Separator()
    lua_pushcfunction(L_, [](lua_State *L) -> int
                      {
        ImGui::Separator();
        return 0; });
    lua_setfield(L_, -2, "Separator");

    // imgui.Begin(title [, flags])
    lua_pushcfunction(L_, [](lua_State *L) -> int
                      {
    const char* title = luaL_checkstring(L, 1);
    int flags = 0;
    if (lua_gettop(L) >= 2 && lua_isinteger(L, 2)) {
        flags = (int)lua_tointeger(L, 2);
    }

    flags |= ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize;

    bool open = ImGui::Begin(title, nullptr, flags);
    lua_pushboolean(L, open);
    return 1; });
    lua_setfield(L_, -2, "Begin");

    // imgui.End()
    lua_pushcfunction(L_, [](lua_State *L) -> int
                      {
        ImGui::End();
        return 0; });
    lua_setfield(L_, -2, "End");

    // imgui.SetNextWindowPos(x, y)
    lua_pushcfunction(L_, [](lua_State *L) -> int
                      {
        float x = (float)luaL_checknumber(L, 1);
        float y = (float)luaL_checknumber(L, 2);
        ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
        return 0; });
    lua_setfield(L_, -2, "SetNextWindowPos");

    // Window flags
    lua_pushinteger(L_, ImGuiWindowFlags_NoFocusOnAppearing);
    lua_setfield(L_, -2, "NoFocusOnAppearing");

    lua_pushinteger(L_, ImGuiWindowFlags_NoInputs);
    lua_setfield(L_, -2, "NoInputs");

    lua_setglobal(L_, "imgui");
}
