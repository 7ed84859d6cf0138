#pragma once

struct lua_State;

namespace Kindling {
class Game;
}

namespace Kindling::Scripting::LuaLoader {

// Register the `game` table.
//
// game.deltaTime()            -> float   -- seconds since last frame
// game.time()                 -> float   -- seconds since the first frame
// game.frame()                -> int     -- frames run so far
// game.fps()                  -> float
// game.print(text, x, y [, r, g, b]) -- debug text for this frame
// game.log(text)                     -- TraceLog at INFO with a [Script] prefix
// game.exit()                        -- stop after this frame
void registerGame(lua_State* L, Game& game);

} // namespace Kindling::Scripting::LuaLoader
