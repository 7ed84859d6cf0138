// Lua script host and the scene / game / input libraries

#include "TestGame.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <Physics/PhysicsComponents.hpp>
#include <Scripting/ScriptHost.hpp>
#include <lua.hpp>
#include <filesystem>
#include <fstream>

using namespace Kindling;
using Catch::Matchers::WithinAbs;
namespace fs = std::filesystem;

static double GlobalNumber(Scripting::ScriptHost& host, const char* name)
{
    lua_State* L = host.State();
    lua_getglobal(L, name);
    double v = lua_tonumber(L, -1);
    lua_pop(L, 1);
    return v;
}

TEST_CASE("ScriptHost runs Start and Update", "[scripting]") {
    Game game(HeadlessSettings());
    Scripting::ScriptHost host(game);
    REQUIRE(host.Init());

    REQUIRE(host.LoadSource(R"(
        started = 0
        updates = 0
        function Start(scene)
            started = started + 1
            scene.spawn("Cube", { name = "A", y = 3 })
        end
        function Update(scene, dt)
            updates = updates + 1
            lastDt = dt
        end
    )"));

    REQUIRE(host.HasFunction("Start"));
    REQUIRE(host.HasFunction("Update"));
    REQUIRE_FALSE(host.HasFunction("Draw"));

    REQUIRE(host.CallStart());
    REQUIRE(game.GetRootScene().Count("A") == 1);
    REQUIRE(game.GetRootScene().FindFirst("A")->transform.position.y == 3.0f);

    REQUIRE(host.CallUpdate(0.25f));
    REQUIRE(GlobalNumber(host, "updates") == 1.0);
    REQUIRE_THAT(GlobalNumber(host, "lastDt"), WithinAbs(0.25, 1e-6));
}

TEST_CASE("ScriptHost errors", "[scripting]") {
    Game game(HeadlessSettings());
    Scripting::ScriptHost host(game);

    SECTION("nothing works before Init") {
        REQUIRE_FALSE(host.LoadSource("x = 1"));
        REQUIRE_FALSE(host.CallStart());
    }

    REQUIRE(host.Init());

    SECTION("syntax errors are recorded") {
        REQUIRE_FALSE(host.LoadSource("function ("));
        REQUIRE_FALSE(host.GetLastError().empty());
        host.ClearLastError();
        REQUIRE(host.GetLastError().empty());
    }

    SECTION("runtime errors in Update return false") {
        REQUIRE(host.LoadSource("function Update(scene, dt) error('boom') end"));
        REQUIRE_FALSE(host.CallUpdate(0.016f));
        REQUIRE(host.GetLastError().find("boom") != std::string::npos);
    }

    SECTION("missing functions are not errors") {
        REQUIRE(host.LoadSource("x = 1"));
        REQUIRE(host.CallStart());
        REQUIRE(host.CallUpdate(0.016f));
    }

    SECTION("unknown primitives raise a Lua error") {
        REQUIRE(host.LoadSource("function Start(scene) scene.spawn('Dodecahedron') end"));
        REQUIRE_FALSE(host.CallStart());
        REQUIRE(host.GetLastError().find("Dodecahedron") != std::string::npos);
        REQUIRE(game.GetRootScene().Size() == 0);
    }

    SECTION("missing files") {
        REQUIRE_FALSE(host.LoadFile("does/not/exist.lua"));
        REQUIRE(host.GetLastError().find("not found") != std::string::npos);
        REQUIRE_FALSE(host.Reload());
    }
}

TEST_CASE("Scene library", "[scripting]") {
    Game game(HeadlessSettings());
    Scripting::ScriptHost host(game);
    REQUIRE(host.Init());

    REQUIRE(host.LoadSource(R"(
        scene.spawn("Sphere", { name = "Ball" })
        scene.spawn("Cube",   { name = "Ball", body = "static" })
        scene.spawn2D("Square", { name = "Tile", size = { 0.5, 0.5 } })
        scene.setPosition("Tile", 1, 2)
        tx, ty, tz = scene.position("Tile")
        balls = scene.count("Ball")
        removed = scene.remove("Ball")
        total = scene.size()
    )"));

    REQUIRE(GlobalNumber(host, "balls") == 2.0);
    REQUIRE(GlobalNumber(host, "removed") == 2.0);
    REQUIRE(GlobalNumber(host, "total") == 1.0);
    REQUIRE(GlobalNumber(host, "tx") == 1.0);
    REQUIRE(GlobalNumber(host, "ty") == 2.0);
    REQUIRE(GlobalNumber(host, "tz") == 0.0);

    Entity* tile = game.GetRootScene().FindFirst("Tile");
    REQUIRE(tile != nullptr);
    auto* body = tile->Get<Physics::RigidbodyComponent>();
    REQUIRE(body != nullptr);
    REQUIRE(body->linearFactor.z == 0.0f);
}

TEST_CASE("Game library", "[scripting]") {
    Game game(HeadlessSettings(5));
    Scripting::ScriptHost host(game);
    REQUIRE(host.Init());
    REQUIRE(host.LoadSource(R"(
        frames = 0
        function Update(scene, dt)
            frames = game.frame()
            step = game.deltaTime()
            game.print("hello", 10, 10)
            if frames == 3 then game.exit() end
        end
    )"));

    host.Attach();
    game.Run();

    REQUIRE(GlobalNumber(host, "frames") == 3.0);
    REQUIRE_THAT(GlobalNumber(host, "step"), WithinAbs(1.0 / 60.0, 1e-6));
}

TEST_CASE("Attach drives the script from the frame loop", "[scripting]") {
    Game game(HeadlessSettings(4));
    Scripting::ScriptHost host(game);
    REQUIRE(host.Init());
    REQUIRE(host.LoadSource(R"(
        started, updates = 0, 0
        function Start(scene) started = started + 1 end
        function Update(scene, dt) updates = updates + 1 end
    )"));

    host.Attach();
    game.Run();

    REQUIRE(GlobalNumber(host, "started") == 1.0);
    REQUIRE(GlobalNumber(host, "updates") == 4.0);
}

TEST_CASE("A destroyed host leaves the frame loop", "[scripting]") {
    Game game(HeadlessSettings());
    {
        Scripting::ScriptHost host(game);
        REQUIRE(host.Init());
        REQUIRE(host.LoadSource("function Update(scene, dt) end"));
        host.Attach();
        host.Attach();
        REQUIRE(game.Tick());
        REQUIRE(game.GetScheduler().TaskCount() == 1);
    }
    REQUIRE(game.Tick());
    REQUIRE(game.GetScheduler().TaskCount() == 0);
}

TEST_CASE("Input library reads the game's input", "[scripting]") {
    Game game(HeadlessSettings(2));
    Scripting::ScriptHost host(game);
    REQUIRE(host.Init());
    REQUIRE(host.LoadSource(R"(
        pressed = 0
        function Update(scene, dt)
            if input.isKeyPressed(input.KEY_SPACE) then pressed = pressed + 1 end
        end
    )"));

    ScriptedInputOf(game).TapKey(KEY_SPACE);
    host.Attach();
    game.Run();

    REQUIRE(GlobalNumber(host, "pressed") == 1.0);
}

TEST_CASE("Reload re-runs the script file", "[scripting]") {
    fs::path dir = fs::temp_directory_path() / "kindling_script_reload";
    fs::create_directories(dir);
    fs::path file = dir / "reload.lua";
    {
        std::ofstream out(file);
        out << "function Start(scene) scene.spawn('Cube', { name = 'Reloaded' }) end\n";
    }

    Game game(HeadlessSettings());
    Scripting::ScriptHost host(game);
    REQUIRE(host.Init());
    REQUIRE(host.LoadFile(file.string()));
    REQUIRE(host.GetScriptPath() == file.string());
    REQUIRE(host.CallStart());

    REQUIRE(host.Reload());
    REQUIRE(game.GetRootScene().Count("Reloaded") == 2);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
