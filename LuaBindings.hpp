#pragma once
#include <string>

struct lua_State;
class Application;

class LuaBindings
{
public:
    explicit LuaBindings(Application *app);
    ~LuaBindings();
    lua_State *L() const { return L_; }
    bool eval(const std::string &code);
    bool loadScript(const std::string &path);
    void loadPluginFile(const std::string &path);
    bool runHook(const char *hookName);
    void loadPlugins();
private:
    void initLua();
    void registerBridges();
    Application *app_;
    lua_State *L_{nullptr};
};
