// 2D shape playground example

#include "TestGame.hpp"
#include "Playground.hpp"
#include <catch2/catch_test_macros.hpp>
#include <Engine/Components.hpp>
#include <Engine/GameExtensions.hpp>
#include <Physics/PhysicsComponents.hpp>
#include <set>

using namespace Kindling;
using ShapePlayground::Playground;
using ShapePlayground::ShapeCatalog;
using GFX::Primitive2DModelType;
namespace GX = Kindling::GameExtensions;

TEST_CASE("ShapeCatalog", "[playground]") {
    ShapeCatalog catalog = ShapeCatalog::Default();
    REQUIRE(catalog.Shapes().size() == 4);

    auto* rect = catalog.Find(Primitive2DModelType::Rectangle);
    REQUIRE(rect != nullptr);
    REQUIRE(rect->size.x == 0.2f);
    REQUIRE(rect->size.y == 0.3f);
    REQUIRE_FALSE(rect->model);

    REQUIRE(catalog.Find(Primitive2DModelType::Circle)->color.r == RED.r);
    REQUIRE(catalog.Find() != nullptr);

    ShapeCatalog empty;
    REQUIRE(empty.Find() == nullptr);
    REQUIRE(empty.Find(Primitive2DModelType::Square) == nullptr);
}

TEST_CASE("Playground spawning", "[playground]") {
    Game game(HeadlessSettings());
    Scene& scene = game.GetRootScene();
    Playground playground(game);
    playground.Start(scene);

    SECTION("start drops the first batch of cubes") {
        REQUIRE(scene.Count(ShapePlayground::CubeEntityName) == ShapePlayground::SpawnBatch);
        REQUIRE(playground.CubeCount() == ShapePlayground::SpawnBatch);
        REQUIRE(scene.Count("Simulation2D") == 1);
        REQUIRE(scene.Count(GX::DefaultGroundName) == 1);

        Entity* cube = scene.FindFirst(ShapePlayground::CubeEntityName);
        REQUIRE(cube->transform.position.z == 0.0f);
        REQUIRE(cube->transform.position.y >= 10.0f);
        REQUIRE(cube->Get<Physics::Body2DComponent>() != nullptr);
        REQUIRE(cube->Get<ModelComponent>() != nullptr);
    }

    SECTION("shapes of one kind share a model") {
        playground.Add2DShapes(scene, Primitive2DModelType::Square, 3);
        REQUIRE(scene.Count(ShapePlayground::ShapeEntityName) == 3);

        std::set<GFX::RenderModel*> models;
        for (const auto& e : scene.Entities())
            if (e->GetName() == ShapePlayground::ShapeEntityName)
                models.insert(e->Get<ModelComponent>()->model.get());
        REQUIRE(models.size() == 1);
        REQUIRE(*models.begin() == playground.Catalog().Find(Primitive2DModelType::Square)->model.get());
    }

    SECTION("triangles are planar rigidbodies") {
        playground.Add2DShapes(scene, Primitive2DModelType::Triangle, 2);
        Entity* tri = scene.FindFirst(ShapePlayground::ShapeEntityName);
        auto* body = tri->Get<Physics::RigidbodyComponent>();
        REQUIRE(body != nullptr);
        REQUIRE(body->linearFactor.z == 0.0f);
        REQUIRE(body->angularFactor.x == 0.0f);
        REQUIRE(body->angularFactor.z == 1.0f);
    }

    SECTION("other shapes use compound 2D bodies") {
        playground.Add2DShapes(scene, Primitive2DModelType::Circle, 1);
        Entity* circle = scene.FindFirst(ShapePlayground::ShapeEntityName);
        auto* body = circle->Get<Physics::Body2DComponent>();
        REQUIRE(body != nullptr);
        REQUIRE(body->collider.colliders.size() == 1);
    }

    SECTION("delete all leaves the rest of the scene") {
        std::size_t before = scene.Size();
        playground.Add2DShapes(scene, std::nullopt, 5);
        playground.DeleteAll(scene);
        REQUIRE(scene.Count(ShapePlayground::CubeEntityName) == 0);
        REQUIRE(scene.Count(ShapePlayground::ShapeEntityName) == 0);
        REQUIRE(scene.Size() == before - ShapePlayground::SpawnBatch);
        REQUIRE(playground.CubeCount() == 0);
    }
}

TEST_CASE("Playground with an empty catalog spawns nothing", "[playground]") {
    Game game(HeadlessSettings());
    Playground playground(game, ShapeCatalog{});
    playground.Add2DShapes(game.GetRootScene(), Primitive2DModelType::Square);
    REQUIRE(game.GetRootScene().Count(ShapePlayground::ShapeEntityName) == 0);
}

TEST_CASE("Playground keyboard controls", "[playground]") {
    Game game(HeadlessSettings());
    Scene& scene = game.GetRootScene();
    auto& input = ScriptedInputOf(game);
    Playground playground(game);

    GX::Schedule(game,
        [&](Scene& s) { playground.Start(s); },
        [&](Scene& s, const GameTime& t) { playground.Update(s, t); });

    input.TapKey(KEY_M);
    REQUIRE(game.Tick());
    REQUIRE(scene.Count(ShapePlayground::ShapeEntityName) == 10);
    REQUIRE(scene.Count(ShapePlayground::CubeEntityName) == 10);

    input.PressKey(KEY_SPACE);
    REQUIRE(game.Tick());
    REQUIRE(playground.CubeCount() == 20);
    REQUIRE(game.Tick());
    REQUIRE(playground.CubeCount() == 30);

    input.ReleaseKey(KEY_SPACE);
    REQUIRE(game.Tick());
    REQUIRE(playground.CubeCount() == 30);

    input.TapKey(KEY_P);
    REQUIRE(game.Tick());
    REQUIRE(scene.Count(ShapePlayground::ShapeEntityName) == 20);

    REQUIRE_FALSE(game.GetDebugText().Entries().empty());
    REQUIRE(game.GetDebugText().Entries().front().text == "Cubes: 30");

    input.TapKey(KEY_X);
    REQUIRE(game.Tick());
    REQUIRE(scene.Count(ShapePlayground::ShapeEntityName) == 20);
    REQUIRE(game.Tick());
    REQUIRE(scene.Count(ShapePlayground::ShapeEntityName) == 0);
    REQUIRE(playground.CubeCount() == 0);
}
