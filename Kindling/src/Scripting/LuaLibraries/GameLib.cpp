#include <Scripting/LuaLoader/GameLib.hpp>
#include <Engine/Game.hpp>
#include <raylib.h>
#include <lua.hpp>

namespace Kindling::Scripting::LuaLoader {

static Game& GameOf(lua_State* L)
{
    return *static_cast<Game*>(lua_touserdata(L, lua_upvalueindex(1)));
}

static int l_deltaTime(lua_State* L)
{
    lua_pushnumber(L, (lua_Number)GameOf(L).GetTime().elapsed);
    return 1;
}

static int l_time(lua_State* L)
{
    lua_pushnumber(L, (lua_Number)GameOf(L).GetTime().total);
    return 1;
}

static int l_frame(lua_State* L)
{
    lua_pushinteger(L, (lua_Integer)GameOf(L).GetTime().frameCount);
    return 1;
}

static int l_fps(lua_State* L)
{
    lua_pushnumber(L, (lua_Number)GameOf(L).GetTime().framesPerSecond);
    return 1;
}

// game.print(text, x, y [, r, g, b])
static int l_print(lua_State* L)
{
    const char* text = luaL_checkstring(L, 1);
    int x = (int)luaL_checkinteger(L, 2);
    int y = (int)luaL_checkinteger(L, 3);
    Color c = WHITE;
    if (lua_gettop(L) >= 6) {
        c.r = (unsigned char)luaL_checkinteger(L, 4);
        c.g = (unsigned char)luaL_checkinteger(L, 5);
        c.b = (unsigned char)luaL_checkinteger(L, 6);
    }
    GameOf(L).GetDebugText().Print(text, x, y, c);
    return 0;
}

static int l_log(lua_State* L)
{
    const char* text = luaL_checkstring(L, 1);
    TraceLog(LOG_INFO, "[Script] %s", text);
    return 0;
}

static int l_exit(lua_State* L)
{
    GameOf(L).Exit();
    return 0;
}

void registerGame(lua_State* L, Game& game)
{
    static const luaL_Reg funcs[] = {
        {"deltaTime", l_deltaTime},
        {"time",      l_time},
        {"frame",     l_frame},
        {"fps",       l_fps},
        {"print",     l_print},
        {"log",       l_log},
        {"exit",      l_exit},
        {nullptr, nullptr}
    };

    luaL_newlibtable(L, funcs);
    lua_pushlightuserdata(L, &game);
    luaL_setfuncs(L, funcs, 1);
    lua_setglobal(L, "game");
}

} // namespace Kindling::Scripting::LuaLoader
