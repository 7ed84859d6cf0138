#include "GameManager.hpp"
#include <Core/Settings.hpp>
#include <Engine/GameExtensions.hpp>
#include <raylib.h>

using namespace Kindling;

//------------------------------------------------------------------------------------
// Program main entry point
//------------------------------------------------------------------------------------
int main(int argc, char** argv)
{
    GameSettings defaults;
    defaults.title = "Cube Clicker";
    GameSettings settings = ParseCommandLine(argc, argv, defaults);

    Game game(settings);

    GameExtensions::Run(game, [&](Scene& scene) {
        GameExtensions::SetupBase3DScene(game);
        GameExtensions::AddProfiler(game);

        auto manager = std::make_shared<Entity>("GameManager");
        manager->Add<CubeClicker::GameManager>(settings.dataDir);
        scene.Add(std::move(manager));

        TraceLog(LOG_INFO, "[CubeClicker] Data directory: %s", settings.dataDir.c_str());
    });

    return 0;
}
