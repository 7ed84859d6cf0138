#pragma once

struct lua_State;

namespace Kindling {
class Game;
}

namespace Kindling::Scripting::LuaLoader {

// Register the `input` table and key/mouse constants into the Lua state.
// Reads the game's InputSource, so scripted input works the same as live input.
//
// -- Keyboard
// input.isKeyDown(key)      -> bool   -- held this frame
// input.isKeyPressed(key)   -> bool   -- first frame down
// input.isKeyReleased(key)  -> bool   -- first frame up
//
// -- Mouse
// input.isMouseDown(btn)     -> bool   -- held (0=left, 1=right, 2=middle)
// input.isMousePressed(btn)  -> bool   -- first frame down
// input.isMouseReleased(btn) -> bool   -- first frame up
// input.getMousePos()        -> x, y   -- screen position
// input.getMouseDelta()      -> dx, dy -- delta since last frame
// input.getMouseWheel()      -> float  -- wheel move this frame
//
// -- Key constants
// input.KEY_A .. input.KEY_Z, input.KEY_0 .. input.KEY_9, input.KEY_F1 .. input.KEY_F12
// input.KEY_UP, KEY_DOWN, KEY_LEFT, KEY_RIGHT, KEY_SPACE, KEY_ENTER, KEY_ESCAPE
// input.KEY_LSHIFT, KEY_LCTRL, KEY_LALT ...
// input.MOUSE_LEFT, MOUSE_RIGHT, MOUSE_MIDDLE
void registerInput(lua_State* L, Game& game);

} // namespace Kindling::Scripting::LuaLoader
