#include <Scripting/ScriptHost.hpp>
#include <Scripting/LuaLoader/GameLib.hpp>
#include <Scripting/LuaLoader/Input.hpp>
#include <Scripting/LuaLoader/SceneLib.hpp>
#include <Engine/Game.hpp>
#include <raylib.h>
#include <filesystem>

#include <lua.hpp>

// Lua binding: reload the current script after this frame. Upvalue 1 = ScriptHost*
static int l_reload(lua_State* L)
{
    void* p = lua_touserdata(L, lua_upvalueindex(1));
    if (!p) {
        lua_pushboolean(L, 0);
        return 1;
    }
    // Deferred so the state is not closed while this C function is running.
    static_cast<Kindling::Scripting::ScriptHost*>(p)->RequestReload();
    lua_pushboolean(L, 1);
    return 1;
}

namespace Kindling::Scripting {

ScriptHost::ScriptHost(Game& game)
    : m_game(game)
{
}

ScriptHost::~ScriptHost()
{
    m_attached.Cancel();
    Close();
}

void ScriptHost::Close()
{
    if (L) {
        lua_close(L);
        L = nullptr;
    }
}

bool ScriptHost::Init()
{
    Close();
    L = luaL_newstate();
    if (!L) {
        TraceLog(LOG_ERROR, "[ScriptHost] Failed to create Lua state");
        return false;
    }
    luaL_openlibs(L);

    LuaLoader::registerScene(L, m_game);
    LuaLoader::registerInput(L, m_game);
    LuaLoader::registerGame(L, m_game);

    lua_pushlightuserdata(L, this);
    lua_pushcclosure(L, l_reload, 1);
    lua_setglobal(L, "reloadScript");

    return true;
}

bool ScriptHost::Execute(int status)
{
    if (status == LUA_OK) status = lua_pcall(L, 0, 0, 0);
    if (status != LUA_OK) {
        const char* msg = lua_tostring(L, -1);
        m_lastLuaError = msg ? msg : "<unknown>";
        TraceLog(LOG_ERROR, "[ScriptHost] %s", m_lastLuaError.c_str());
        lua_pop(L, 1);
        return false;
    }
    return true;
}

bool ScriptHost::LoadFile(const std::string& path)
{
    if (!L) {
        TraceLog(LOG_ERROR, "[ScriptHost] Call Init() before LoadFile().");
        return false;
    }
    if (!std::filesystem::exists(path)) {
        m_lastLuaError = "Script not found: " + path;
        TraceLog(LOG_ERROR, "[ScriptHost] %s", m_lastLuaError.c_str());
        return false;
    }
    m_scriptPath = path;
    TraceLog(LOG_INFO, "[ScriptHost] Loading %s", path.c_str());
    return Execute(luaL_loadfile(L, path.c_str()));
}

bool ScriptHost::LoadSource(const std::string& source, const std::string& chunkName)
{
    if (!L) {
        TraceLog(LOG_ERROR, "[ScriptHost] Call Init() before LoadSource().");
        return false;
    }
    return Execute(luaL_loadbuffer(L, source.data(), source.size(), chunkName.c_str()));
}

bool ScriptHost::HasFunction(const char* name) const
{
    if (!L) return false;
    lua_getglobal(L, name);
    bool fn = lua_isfunction(L, -1);
    lua_pop(L, 1);
    return fn;
}

// Expects `nargs` arguments on the stack; they are consumed either way.
bool ScriptHost::CallGlobal(const char* name, int nargs)
{
    lua_getglobal(L, name);
    if (!lua_isfunction(L, -1)) {
        lua_pop(L, 1 + nargs);
        return true;
    }
    lua_insert(L, -(nargs + 1));
    if (lua_pcall(L, nargs, 0, 0) != LUA_OK) {
        const char* err = lua_tostring(L, -1);
        m_lastLuaError = err ? err : "<unknown>";
        TraceLog(LOG_ERROR, "[ScriptHost] %s() error: %s", name, m_lastLuaError.c_str());
        lua_pop(L, 1);
        return false;
    }
    return true;
}

bool ScriptHost::CallStart()
{
    if (!L) return false;
    lua_getglobal(L, "scene");
    return CallGlobal("Start", 1);
}

bool ScriptHost::CallUpdate(float dt)
{
    if (!L) return false;
    lua_getglobal(L, "scene");
    lua_pushnumber(L, (lua_Number)dt);
    bool ok = CallGlobal("Update", 2);

    if (m_reloadRequested) {
        m_reloadRequested = false;
        Reload();
    }
    return ok;
}

bool ScriptHost::Reload()
{
    if (m_scriptPath.empty()) {
        TraceLog(LOG_ERROR, "[ScriptHost] Reload(): no script loaded previously");
        return false;
    }
    std::string path = m_scriptPath;
    if (!Init() || !LoadFile(path)) return false;

    TraceLog(LOG_INFO, "[ScriptHost] Reloaded %s", path.c_str());
    return CallStart();
}

CancellationToken ScriptHost::Attach()
{
    m_attached.Cancel();
    m_attached = CancellationToken();

    bool started = false;
    m_game.GetScheduler().Add([this, started]() mutable {
        if (!started) {
            started = true;
            CallStart();
        }
        CallUpdate(m_game.GetTime().elapsed);
        return TaskStatus::Continue;
    }, m_attached, "ScriptHost");
    return m_attached;
}

} // namespace Kindling::Scripting
