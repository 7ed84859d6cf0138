#include <Scripting/LuaLoader/SceneLib.hpp>
#include <Engine/Game.hpp>
#include <Engine/GameExtensions.hpp>
#include <raylib.h>
#include <lua.hpp>
#include <cstdio>
#include <exception>
#include <string>

namespace Kindling::Scripting::LuaLoader {

namespace GX = Kindling::GameExtensions;

static Game& GameOf(lua_State* L)
{
    return *static_cast<Game*>(lua_touserdata(L, lua_upvalueindex(1)));
}

// ── Option table helpers (table at stack index 2, may be absent) ─────────────

static float OptNumber(lua_State* L, const char* key, float fallback)
{
    if (!lua_istable(L, 2)) return fallback;
    lua_getfield(L, 2, key);
    float v = lua_isnumber(L, -1) ? (float)lua_tonumber(L, -1) : fallback;
    lua_pop(L, 1);
    return v;
}

static std::string OptString(lua_State* L, const char* key, const char* fallback)
{
    if (!lua_istable(L, 2)) return fallback;
    lua_getfield(L, 2, key);
    std::string v = lua_type(L, -1) == LUA_TSTRING ? lua_tostring(L, -1) : fallback;
    lua_pop(L, 1);
    return v;
}

// Reads up to `n` numbers from the array at opts[key]. Returns how many were read.
static int OptArray(lua_State* L, const char* key, float* out, int n)
{
    if (!lua_istable(L, 2)) return 0;
    lua_getfield(L, 2, key);
    int count = 0;
    if (lua_istable(L, -1)) {
        for (int i = 1; i <= n; ++i) {
            lua_rawgeti(L, -1, i);
            if (lua_isnumber(L, -1)) out[count++] = (float)lua_tonumber(L, -1);
            lua_pop(L, 1);
            if (count < i) break;
        }
    }
    lua_pop(L, 1);
    return count;
}

struct SpawnRequest {
    std::string name;
    Vector3     position;
    float       size[3];
    int         sizeCount;
    float       depth;
    bool        hasColor;
    Color       color;
    std::string body;
};

static SpawnRequest ReadRequest(lua_State* L)
{
    SpawnRequest r;
    r.name      = OptString(L, "name", "Entity");
    r.position  = { OptNumber(L, "x", 0.0f), OptNumber(L, "y", 0.0f), OptNumber(L, "z", 0.0f) };
    r.sizeCount = OptArray(L, "size", r.size, 3);
    r.depth     = OptNumber(L, "depth", GFX::DefaultShapeDepth);
    float rgba[4] = { 0, 0, 0, 255 };
    int   n       = OptArray(L, "color", rgba, 4);
    r.hasColor    = n >= 3;
    r.color       = { (unsigned char)rgba[0], (unsigned char)rgba[1], (unsigned char)rgba[2],
                      (unsigned char)(n == 4 ? rgba[3] : 255) };
    r.body        = OptString(L, "body", "dynamic");
    return r;
}

static std::shared_ptr<Physics::ColliderComponent> MakeBody(const std::string& kind, bool planar)
{
    if (kind == "none")   return nullptr;
    if (kind == "static") return std::make_shared<Physics::StaticColliderComponent>();
    auto body = std::make_shared<Physics::RigidbodyComponent>();
    if (planar) {
        body->linearFactor  = { 1, 1, 0 };
        body->angularFactor = { 0, 0, 1 };
    }
    return body;
}

// Builds and adds the entity. Returns an empty string or the error message.
static std::string Spawn(Game& game, const std::string& typeName, const SpawnRequest& r, bool is2D)
{
    try {
        std::shared_ptr<Entity> entity;
        if (is2D) {
            auto type = GFX::ParsePrimitive2DModelType(typeName);
            if (!type) return "unknown 2D shape '" + typeName + "'";

            GX::Primitive2DCreationOptions opts;
            opts.entityName       = r.name;
            opts.depth            = r.depth;
            opts.physicsComponent = MakeBody(r.body, true);
            if (r.sizeCount >= 2) opts.size = Vector2{ r.size[0], r.size[1] };
            else if (r.sizeCount == 1) opts.size = Vector2{ r.size[0], r.size[0] };
            if (r.hasColor) opts.material = GX::CreateMaterial(game, r.color);
            entity = GX::Create2DPrimitive(game, *type, opts);
        } else {
            auto type = GFX::ParsePrimitiveModelType(typeName);
            if (!type) return "unknown primitive '" + typeName + "'";

            GX::Primitive3DCreationOptions opts;
            opts.entityName       = r.name;
            opts.physicsComponent = MakeBody(r.body, false);
            if (r.sizeCount == 3) opts.size = Vector3{ r.size[0], r.size[1], r.size[2] };
            else if (r.sizeCount == 2) opts.size = Vector3{ r.size[0], r.size[1], 0.0f };
            else if (r.sizeCount == 1) opts.size = Vector3{ r.size[0], r.size[0], r.size[0] };
            if (r.hasColor) opts.material = GX::CreateMaterial(game, r.color);
            entity = GX::CreatePrimitive(game, *type, opts);
        }
        entity->transform.position = r.position;
        game.GetRootScene().Add(std::move(entity));
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

// Copies the message into a fixed buffer so no C++ object is alive when
// luaL_error unwinds.
static bool Run(Game& game, lua_State* L, bool is2D, char* err, std::size_t errSize)
{
    std::string message;
    {
        SpawnRequest r = ReadRequest(L);
        message = Spawn(game, lua_tostring(L, 1), r, is2D);
    }
    if (message.empty()) return true;
    snprintf(err, errSize, "%s", message.c_str());
    return false;
}

static int l_spawn(lua_State* L)
{
    luaL_checkstring(L, 1);
    if (!lua_isnoneornil(L, 2)) luaL_checktype(L, 2, LUA_TTABLE);
    char err[256];
    if (!Run(GameOf(L), L, false, err, sizeof(err))) return luaL_error(L, "scene.spawn: %s", err);
    lua_pushboolean(L, 1);
    return 1;
}

static int l_spawn2D(lua_State* L)
{
    luaL_checkstring(L, 1);
    if (!lua_isnoneornil(L, 2)) luaL_checktype(L, 2, LUA_TTABLE);
    char err[256];
    if (!Run(GameOf(L), L, true, err, sizeof(err))) return luaL_error(L, "scene.spawn2D: %s", err);
    lua_pushboolean(L, 1);
    return 1;
}

static int l_count(lua_State* L)
{
    const char* name = luaL_checkstring(L, 1);
    lua_pushinteger(L, (lua_Integer)GameOf(L).GetRootScene().Count(name));
    return 1;
}

static int l_remove(lua_State* L)
{
    const char* name = luaL_checkstring(L, 1);
    lua_pushinteger(L, (lua_Integer)GameOf(L).GetRootScene().RemoveAll(name));
    return 1;
}

static int l_size(lua_State* L)
{
    lua_pushinteger(L, (lua_Integer)GameOf(L).GetRootScene().Size());
    return 1;
}

static int l_position(lua_State* L)
{
    const char* name = luaL_checkstring(L, 1);
    Entity* e = GameOf(L).GetRootScene().FindFirst(name);
    if (!e) {
        lua_pushnil(L);
        return 1;
    }
    lua_pushnumber(L, e->transform.position.x);
    lua_pushnumber(L, e->transform.position.y);
    lua_pushnumber(L, e->transform.position.z);
    return 3;
}

static int l_setPosition(lua_State* L)
{
    const char* name = luaL_checkstring(L, 1);
    Vector3 p = { (float)luaL_checknumber(L, 2), (float)luaL_checknumber(L, 3), (float)luaL_optnumber(L, 4, 0.0) };
    Entity* e = GameOf(L).GetRootScene().FindFirst(name);
    if (e) e->transform.position = p;
    lua_pushboolean(L, e ? 1 : 0);
    return 1;
}

void registerScene(lua_State* L, Game& game)
{
    static const luaL_Reg funcs[] = {
        {"spawn",       l_spawn},
        {"spawn2D",     l_spawn2D},
        {"count",       l_count},
        {"remove",      l_remove},
        {"size",        l_size},
        {"position",    l_position},
        {"setPosition", l_setPosition},
        {nullptr, nullptr}
    };

    luaL_newlibtable(L, funcs);
    lua_pushlightuserdata(L, &game);
    luaL_setfuncs(L, funcs, 1);
    lua_setglobal(L, "scene");
}

} // namespace Kindling::Scripting::LuaLoader
