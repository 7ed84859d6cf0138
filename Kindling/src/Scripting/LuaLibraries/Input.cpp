#include <Scripting/LuaLoader/Input.hpp>
#include <Engine/Game.hpp>
#include <raylib.h>
#include <lua.hpp>
#include <cstdio>

namespace Kindling::Scripting::LuaLoader {

using Input::InputSource;

// Every binding is a closure over (Game*, query index).
using StateQuery  = bool (InputSource::*)(int) const;
using VectorQuery = Vector2 (InputSource::*)() const;

struct StateBinding {
    const char* name;
    StateQuery  query;
};

struct VectorBinding {
    const char* name;
    VectorQuery query;
};

static const StateBinding StateBindings[] = {
    {"isKeyDown",       &InputSource::IsKeyDown},
    {"isKeyPressed",    &InputSource::IsKeyPressed},
    {"isKeyReleased",   &InputSource::IsKeyReleased},
    {"isMouseDown",     &InputSource::IsMouseButtonDown},
    {"isMousePressed",  &InputSource::IsMouseButtonPressed},
    {"isMouseReleased", &InputSource::IsMouseButtonReleased},
};

static const VectorBinding VectorBindings[] = {
    {"getMousePos",   &InputSource::MousePosition},
    {"getMouseDelta", &InputSource::MouseDelta},
};

static const InputSource& SourceOf(lua_State* L)
{
    return static_cast<Game*>(lua_touserdata(L, lua_upvalueindex(1)))->GetInput();
}

static int l_state(lua_State* L)
{
    const auto& binding = StateBindings[lua_tointeger(L, lua_upvalueindex(2))];
    int code = (int)luaL_checkinteger(L, 1);
    lua_pushboolean(L, (SourceOf(L).*binding.query)(code) ? 1 : 0);
    return 1;
}

static int l_vector(lua_State* L)
{
    const auto& binding = VectorBindings[lua_tointeger(L, lua_upvalueindex(2))];
    Vector2 v = (SourceOf(L).*binding.query)();
    lua_pushnumber(L, v.x);
    lua_pushnumber(L, v.y);
    return 2;
}

static int l_wheel(lua_State* L)
{
    lua_pushnumber(L, (lua_Number)SourceOf(L).MouseWheel());
    return 1;
}

static void SetConstant(lua_State* L, const char* name, int code)
{
    lua_pushinteger(L, code);
    lua_setfield(L, -2, name);
}

// Constants for a run of consecutive raylib codes starting at firstCode.
static void SetRange(lua_State* L, const char* format, int from, int to, int firstCode, bool letters)
{
    char name[16];
    for (int i = from; i <= to; ++i) {
        if (letters) snprintf(name, sizeof(name), format, 'A' + i);
        else         snprintf(name, sizeof(name), format, i);
        SetConstant(L, name, firstCode + (i - from));
    }
}

void registerInput(lua_State* L, Game& game)
{
    lua_newtable(L);

    for (int i = 0; i < (int)(sizeof(StateBindings) / sizeof(StateBindings[0])); ++i) {
        lua_pushlightuserdata(L, &game);
        lua_pushinteger(L, i);
        lua_pushcclosure(L, l_state, 2);
        lua_setfield(L, -2, StateBindings[i].name);
    }
    for (int i = 0; i < (int)(sizeof(VectorBindings) / sizeof(VectorBindings[0])); ++i) {
        lua_pushlightuserdata(L, &game);
        lua_pushinteger(L, i);
        lua_pushcclosure(L, l_vector, 2);
        lua_setfield(L, -2, VectorBindings[i].name);
    }
    lua_pushlightuserdata(L, &game);
    lua_pushcclosure(L, l_wheel, 1);
    lua_setfield(L, -2, "getMouseWheel");

    SetRange(L, "KEY_%c", 0, 25, KEY_A, true);
    SetRange(L, "KEY_%d", 0, 9, KEY_ZERO, false);
    SetRange(L, "KEY_F%d", 1, 12, KEY_F1, false);

    SetConstant(L, "KEY_SPACE",     KEY_SPACE);
    SetConstant(L, "KEY_ENTER",     KEY_ENTER);
    SetConstant(L, "KEY_ESCAPE",    KEY_ESCAPE);
    SetConstant(L, "KEY_TAB",       KEY_TAB);
    SetConstant(L, "KEY_BACKSPACE", KEY_BACKSPACE);
    SetConstant(L, "KEY_DELETE",    KEY_DELETE);
    SetConstant(L, "KEY_UP",        KEY_UP);
    SetConstant(L, "KEY_DOWN",      KEY_DOWN);
    SetConstant(L, "KEY_LEFT",      KEY_LEFT);
    SetConstant(L, "KEY_RIGHT",     KEY_RIGHT);
    SetConstant(L, "KEY_LSHIFT",    KEY_LEFT_SHIFT);
    SetConstant(L, "KEY_RSHIFT",    KEY_RIGHT_SHIFT);
    SetConstant(L, "KEY_LCTRL",     KEY_LEFT_CONTROL);
    SetConstant(L, "KEY_RCTRL",     KEY_RIGHT_CONTROL);
    SetConstant(L, "KEY_LALT",      KEY_LEFT_ALT);
    SetConstant(L, "KEY_RALT",      KEY_RIGHT_ALT);

    SetConstant(L, "MOUSE_LEFT",    MOUSE_BUTTON_LEFT);
    SetConstant(L, "MOUSE_RIGHT",   MOUSE_BUTTON_RIGHT);
    SetConstant(L, "MOUSE_MIDDLE",  MOUSE_BUTTON_MIDDLE);

    lua_setglobal(L, "input");
}

} // namespace Kindling::Scripting::LuaLoader
