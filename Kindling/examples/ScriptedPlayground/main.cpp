#include <Core/AssetPath.hpp>
#include <Core/Settings.hpp>
#include <Engine/GameExtensions.hpp>
#include <Scripting/ScriptHost.hpp>
#include <raylib.h>

using namespace Kindling;

static constexpr const char* DefaultScript = "scripts/playground.lua";

int main(int argc, char** argv)
{
    GameSettings defaults;
    defaults.title      = "Scripted Playground";
    defaults.scriptPath = DefaultScript;
    GameSettings settings = ParseCommandLine(argc, argv, defaults);

    Game game(settings);

    Scripting::ScriptHost host(game);
    if (!host.Init()) return 1;

    std::string script = ResolveAssetPath(settings.scriptPath);
    if (!host.LoadFile(script)) {
        TraceLog(LOG_ERROR, "[ScriptedPlayground] %s", host.GetLastError().c_str());
        return 1;
    }

    // Scene first, so Start(scene) sees the camera and ground.
    GameExtensions::Schedule(game, [&](Scene&) {
        GameExtensions::SetupBase3DScene(game);
        GameExtensions::AddProfiler(game);
    });
    host.Attach();

    game.Run();
    return 0;
}
