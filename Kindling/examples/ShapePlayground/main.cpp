#include "Playground.hpp"
#include <Kindling.hpp>

using namespace Kindling;

int main(int argc, char** argv)
{
    GameSettings settings = ParseCommandLine(argc, argv);
    Game game(settings);

    ShapePlayground::Playground playground(game);

    GameExtensions::Run(
        game,
        [&](Scene& scene) { playground.Start(scene); },
        [&](Scene& scene, const GameTime& time) { playground.Update(scene, time); });

    return 0;
}
