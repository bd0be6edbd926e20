#include "Config.hpp"
#include <cassert>
#include <string>

extern "C"
{
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

static EditorConfig configFrom(const char *script) {
  lua_State *L = luaL_newstate();
  luaL_openlibs(L);
  int failed = luaL_dostring(L, script);
  assert(failed == 0);
  (void)failed;
  EditorConfig config = EditorConfig::fromLua(L);
  lua_close(L);
  return config;
}

int main() {
  // nothing set keeps every default
  EditorConfig defaults = configFrom("");
  assert(defaults.fontPath.empty());
  assert(defaults.fontSize == 16.0f);
  assert(defaults.showLineNumbers);
  assert(defaults.darkTheme);
  assert(!defaults.startupFile);
  assert(defaults.windowWidth == 1280);
  assert(defaults.windowHeight == 720);

  EditorConfig custom = configFrom(R"(
    theme = "light"
    show_line_numbers = false
    font_path = "fonts/mono.ttf"
    font_size = 20
    startup_file = "notes.txt"
    window_width = 800
    window_height = 600
  )");
  assert(!custom.darkTheme);
  assert(!custom.showLineNumbers);
  assert(custom.fontPath == "fonts/mono.ttf");
  assert(custom.fontSize == 20.0f);
  assert(custom.startupFile && *custom.startupFile == "notes.txt");
  assert(custom.windowWidth == 800);
  assert(custom.windowHeight == 600);

  // wrong types and silly values are ignored
  EditorConfig odd = configFrom(R"(
    show_line_numbers = "no"
    font_size = -3
    window_width = 10
    startup_file = ""
    theme = 42
  )");
  assert(odd.showLineNumbers);
  assert(odd.fontSize == 16.0f);
  assert(odd.windowWidth == 1280);
  assert(!odd.startupFile);
  assert(odd.darkTheme);

  // huge numbers are clamped instead of overflowing the int conversion
  EditorConfig huge = configFrom("window_width = 1e20\nwindow_height = math.huge\nfont_size = 1e300");
  assert(huge.windowWidth == 16384);
  assert(huge.windowHeight == 16384);
  assert(huge.fontSize == 256.0f);

  // values computed by the script count too
  EditorConfig computed = configFrom("font_size = 10 + 4\nwindow_height = 300 * 2");
  assert(computed.fontSize == 14.0f);
  assert(computed.windowHeight == 600);
  return 0;
}
