#pragma once

#include <Engine/Scheduler.hpp>
#include <string>

struct lua_State;

namespace Kindling {
class Game;
}

namespace Kindling::Scripting {

// Runs a Lua 5.4 script against a Game.
//
// The script sees three libraries (scene.*, input.*, game.*, see LuaLoader/)
// and may define two globals:
//
//   function Start(scene)       -- once, on the first frame
//   function Update(scene, dt)  -- every frame after that
//
// Lua errors never propagate: they are logged and kept in GetLastError().
class ScriptHost {
public:
    explicit ScriptHost(Game& game);
    ~ScriptHost();

    ScriptHost(const ScriptHost&)            = delete;
    ScriptHost& operator=(const ScriptHost&) = delete;

    // Create the Lua state and register the engine libraries.
    bool Init();

    // Load and execute a script file / a chunk of source.
    bool LoadFile(const std::string& path);
    bool LoadSource(const std::string& source, const std::string& chunkName = "=script");

    bool HasFunction(const char* name) const;

    // Call the script's Start(scene) / Update(scene, dt). A missing function
    // is not an error.
    bool CallStart();
    bool CallUpdate(float dt);

    // Re-create the state and re-run the last loaded file.
    bool Reload();

    // Ask for a Reload() after the current Update returns (scripts call
    // reloadScript() for this).
    void RequestReload() { m_reloadRequested = true; }

    // Register Start/Update with the game's frame loop. Attaching again, or
    // destroying the host, cancels the previous registration.
    CancellationToken Attach();

    const std::string& GetLastError() const { return m_lastLuaError; }
    void ClearLastError() { m_lastLuaError.clear(); }

    const std::string& GetScriptPath() const { return m_scriptPath; }

    lua_State* State() { return L; }

private:
    bool Execute(int status);
    bool CallGlobal(const char* name, int nargs);
    void Close();

    Game&       m_game;
    lua_State*  L = nullptr;
    std::string m_scriptPath;
    std::string m_lastLuaError;
    bool        m_reloadRequested = false;

    CancellationToken m_attached;
};

} // namespace Kindling::Scripting
