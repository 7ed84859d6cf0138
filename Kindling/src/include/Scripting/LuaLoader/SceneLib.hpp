#pragma once

struct lua_State;

namespace Kindling {
class Game;
}

namespace Kindling::Scripting::LuaLoader {

// Register the `scene` table: spawning primitives into the game's root scene
// and querying / removing root entities by name.
//
// scene.spawn(type, opts)    -> true    -- 3D primitive ("Cube", "Sphere", ...)
// scene.spawn2D(type, opts)  -> true    -- 2D shape ("Square", "Circle", ...)
//   opts (all optional):
//     name   = "Entity"
//     x, y, z = 0
//     size   = { x, y [, z] }
//     depth  = 0.04                      -- 2D only
//     color  = { r, g, b [, a] }         -- 0..255
//     body   = "dynamic" | "static" | "none"   (default "dynamic")
//   Unknown types or shapes without a collider raise a Lua error.
//
// scene.count(name)          -> int     -- root entities with that name
// scene.remove(name)         -> int     -- number removed
// scene.size()               -> int     -- root entity count
// scene.position(name)       -> x, y, z | nil
// scene.setPosition(name, x, y, z) -> bool
void registerScene(lua_State* L, Game& game);

} // namespace Kindling::Scripting::LuaLoader
