// Entity composition and scene bootstrap helpers

#include "TestGame.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <Core/Error.hpp>
#include <Engine/GameExtensions.hpp>
#include <Physics/PhysicsComponents.hpp>
#include <Scripts/CameraControllers.hpp>
#include <Scripts/GameProfiler.hpp>
#include <cmath>

using namespace Kindling;
namespace GX = Kindling::GameExtensions;
using GFX::Primitive2DModelType;
using GFX::PrimitiveModelType;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Primitive composition
// =============================================================================

TEST_CASE("CreatePrimitive attaches model, material and collider", "[composition]") {
    Game game(HeadlessSettings());

    GX::Primitive3DCreationOptions options;
    options.entityName  = "Crate";
    options.size        = Vector3{ 1, 2, 3 };
    options.material    = GX::CreateMaterial(game, RED);
    options.renderGroup = RenderGroup::Group3;

    auto entity = GX::CreatePrimitive(game, PrimitiveModelType::Cube, options);
    REQUIRE(entity->GetName() == "Crate");
    REQUIRE(entity->GetScene() == nullptr);

    auto* model = entity->Get<ModelComponent>();
    REQUIRE(model != nullptr);
    REQUIRE(model->renderGroup == RenderGroup::Group3);
    REQUIRE(model->model->Materials().size() == 1);
    REQUIRE(model->model->Materials()[0].diffuse.r == RED.r);

    auto* body = entity->Get<Physics::RigidbodyComponent>();
    REQUIRE(body != nullptr);
    REQUIRE(body == options.physicsComponent.get());
    REQUIRE(body->colliderShapes.size() == 1);
    REQUIRE(body->colliderShapes[0].As<Physics::BoxShape>()->size.z == 3.0f);
}

TEST_CASE("CreatePrimitive skips physics when asked or unmappable", "[composition]") {
    Game game(HeadlessSettings());

    SECTION("no collider requested") {
        GX::Primitive3DCreationOptions options;
        options.includeCollider = false;
        auto entity = GX::CreatePrimitive(game, PrimitiveModelType::Sphere, options);
        REQUIRE(entity->Get<Physics::PhysicsComponent>() == nullptr);
        REQUIRE(options.physicsComponent->colliderShapes.empty());
    }

    SECTION("no physics component supplied") {
        GX::Primitive3DCreationOptions options;
        options.physicsComponent = nullptr;
        auto entity = GX::CreatePrimitive(game, PrimitiveModelType::Cube, options);
        REQUIRE(entity->Get<Physics::PhysicsComponent>() == nullptr);
        REQUIRE(entity->Get<ModelComponent>() != nullptr);
    }

    SECTION("torus has no collider") {
        auto entity = GX::CreatePrimitive(game, PrimitiveModelType::Torus);
        REQUIRE(entity->Get<Physics::PhysicsComponent>() == nullptr);
        REQUIRE(entity->Get<ModelComponent>() != nullptr);
    }

    SECTION("unnamed entities get the default name") {
        auto entity = GX::CreatePrimitive(game, PrimitiveModelType::Cone);
        REQUIRE(entity->GetName() == "Entity");
    }
}

TEST_CASE("2D primitives", "[composition][2d]") {
    Game game(HeadlessSettings());

    SECTION("compound square of size 0.2 gets a 0.2 x 0.2 x depth box") {
        GX::Primitive2DCreationOptionsCompound options;
        options.size = Vector2{ 0.2f, 0.2f };

        auto entity = GX::Create2DPrimitiveCompound(game, Primitive2DModelType::Square, options);
        auto* body  = entity->Get<Physics::Body2DComponent>();
        REQUIRE(body != nullptr);
        REQUIRE(body->collider.colliders.size() == 1);

        const auto* box = body->collider.colliders[0].As<Physics::BoxShape>();
        REQUIRE(box != nullptr);
        REQUIRE_THAT(box->size.x, WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(box->size.y, WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(box->size.z, WithinAbs(options.depth, 1e-6f));
    }

    SECTION("circles are turned 90 degrees about X") {
        const float s = std::sqrt(0.5f);

        auto flat = GX::Create2DPrimitive(game, Primitive2DModelType::Circle);
        REQUIRE_THAT(flat->transform.rotation.x, WithinAbs(s, 1e-5f));
        REQUIRE_THAT(flat->transform.rotation.w, WithinAbs(s, 1e-5f));

        auto compound = GX::Create2DPrimitiveCompound(game, Primitive2DModelType::Circle);
        REQUIRE_THAT(compound->transform.rotation.x, WithinAbs(s, 1e-5f));
        REQUIRE_THAT(compound->transform.rotation.w, WithinAbs(s, 1e-5f));
    }

    SECTION("other shapes keep the identity rotation") {
        auto square = GX::Create2DPrimitive(game, Primitive2DModelType::Square);
        REQUIRE(square->transform.rotation.w == 1.0f);
    }

    SECTION("triangles carry a convex hull") {
        GX::Primitive2DCreationOptions options;
        options.size = Vector2{ 0.2f, 0.2f };

        auto entity = GX::Create2DPrimitive(game, Primitive2DModelType::Triangle, options);
        auto* body  = entity->Get<Physics::RigidbodyComponent>();
        REQUIRE(body != nullptr);
        REQUIRE(body->colliderShapes.size() == 1);

        const auto* hull = body->colliderShapes[0].As<Physics::ConvexHullShape>();
        REQUIRE(hull != nullptr);
        const auto& mesh = entity->Get<ModelComponent>()->model->Meshes()[0];
        REQUIRE(hull->PointCount() == (std::size_t)mesh.VertexCount());
    }

    SECTION("compound triangles are rejected") {
        REQUIRE_THROWS_AS(GX::Create2DPrimitiveCompound(game, Primitive2DModelType::Triangle), InvalidOperationError);
    }
}

TEST_CASE("Compound 3D primitive", "[composition]") {
    Game game(HeadlessSettings());

    GX::Primitive3DCreationOptionsCompound options;
    options.size = Vector3{ 2, 2, 2 };
    auto entity = GX::CreatePrimitiveCompound(game, PrimitiveModelType::Cube, options);

    auto* body = entity->Get<Physics::BodyComponent>();
    REQUIRE(body != nullptr);
    REQUIRE(body->IsDynamic());
    REQUIRE(body->collider.colliders[0].As<Physics::BoxShape>()->size.x == 2.0f);
}

// =============================================================================
// Scene setup
// =============================================================================

TEST_CASE("Cameras need a compositor slot", "[setup][camera]") {
    Game game(HeadlessSettings());

    SECTION("no compositor") {
        REQUIRE_THROWS_AS(GX::Add3DCamera(game), InvalidOperationError);
    }

    SECTION("compositor without slots") {
        GX::AddGraphicsCompositor(game).cameraSlots.clear();
        REQUIRE_THROWS_AS(GX::Add3DCamera(game), InvalidOperationError);
    }

    SECTION("the first slot takes the camera's name") {
        GX::AddGraphicsCompositor(game);
        Entity* camera = GX::Add3DCamera(game, "Overview");
        REQUIRE(game.GetCompositor()->cameraSlots[0] == "Overview");
        REQUIRE(camera->Get<CameraComponent>()->slot == "Overview");
        REQUIRE(camera->transform.position.x == GX::Initial3DCameraPosition.x);
    }
}

TEST_CASE("SetupBase3DScene", "[setup]") {
    Game game(HeadlessSettings());
    GX::SetupBase3DScene(game);
    Scene& scene = game.GetRootScene();

    REQUIRE(game.GetCompositor() != nullptr);
    REQUIRE(game.GetCompositor()->uiStage);

    Entity* camera = scene.FindFirst(GX::DefaultCameraName);
    REQUIRE(camera != nullptr);
    REQUIRE(camera->Get<CameraComponent>()->projection == CameraProjectionMode::Perspective);
    REQUIRE(camera->Get<BasicCameraController>() != nullptr);

    Entity* ground = scene.FindFirst(GX::DefaultGroundName);
    REQUIRE(ground != nullptr);
    auto* collider = ground->Get<Physics::StaticColliderComponent>();
    REQUIRE(collider != nullptr);
    const auto* box = collider->colliderShapes[0].As<Physics::BoxShape>();
    REQUIRE(box->size.x == 15.0f);
    REQUIRE(box->size.z == 15.0f);

    int directional = 0, skybox = 0;
    scene.ForEach<LightComponent>([&](Entity&, LightComponent& l) {
        if (l.type == LightType::Directional) ++directional;
        if (l.type == LightType::Skybox) ++skybox;
    });
    REQUIRE(directional == 1);
    REQUIRE(skybox == 1);
}

TEST_CASE("SetupBase2DScene", "[setup][2d]") {
    Game game(HeadlessSettings());
    GX::SetupBase2DScene(game);
    Scene& scene = game.GetRootScene();

    Entity* camera = scene.FindFirst(GX::DefaultCameraName);
    REQUIRE(camera != nullptr);
    REQUIRE(camera->Get<CameraComponent>()->projection == CameraProjectionMode::Orthographic);
    REQUIRE(camera->Get<Camera2DController>() != nullptr);
    REQUIRE(camera->transform.position.z == 50.0f);

    Entity* ground = scene.FindFirst(GX::DefaultGroundName);
    REQUIRE(ground != nullptr);
    const auto& shape = ground->Get<Physics::StaticColliderComponent>()->colliderShapes[0];
    REQUIRE(shape.Is2D());
    REQUIRE_THAT(shape.As<Physics::BoxShape>()->size.y, WithinAbs(0.1f, 1e-6f));
}

TEST_CASE("SetupBase3DSceneCompound uses a static compound ground", "[setup]") {
    Game game(HeadlessSettings());
    GX::SetupBase3DSceneCompound(game);

    Entity* ground = game.GetRootScene().FindFirst(GX::DefaultGroundName);
    REQUIRE(ground != nullptr);
    auto* stat = ground->Get<Physics::StaticComponent>();
    REQUIRE(stat != nullptr);
    REQUIRE_FALSE(stat->IsDynamic());
}

TEST_CASE("Lighting, gizmos and diagnostics", "[setup]") {
    Game game(HeadlessSettings());
    Scene& scene = game.GetRootScene();

    SECTION("all-direction lighting adds five lights with gizmos") {
        GX::AddAllDirectionLighting(game, 5.0f, true);
        int lights = 0, gizmos = 0;
        scene.ForEach<LightComponent>([&](Entity& e, LightComponent& l) {
            ++lights;
            REQUIRE(l.intensity == 5.0f);
            if (e.Get<GizmoComponent>()) ++gizmos;
        });
        REQUIRE(lights == 5);
        REQUIRE(gizmos == 5);
    }

    SECTION("ground gizmo hangs off the ground") {
        GX::AddGroundGizmo(game);   // nothing to attach to yet
        GX::SetupBase3DScene(game);
        GX::AddGroundGizmo(game, Vector3{ -5, 0.1f, -5 }, true);

        Entity* ground = scene.FindFirst(GX::DefaultGroundName);
        REQUIRE(ground->Children().size() == 1);
        REQUIRE(ground->Children()[0]->Get<GizmoComponent>()->showAxisName);
    }

    SECTION("profiler and collider display") {
        Entity* profiler = GX::AddProfiler(game);
        REQUIRE(profiler->GetName() == "Profiler");
        REQUIRE(profiler->Get<GameProfiler>() != nullptr);

        GX::ShowColliders(game);
        REQUIRE(game.GetRenderer().showColliders);
    }

    SECTION("frame rate cap") {
        GX::SetMaxFPS(game, 0);
        REQUIRE(game.GetTargetFPS() == 0);
        GX::SetMaxFPS(game, 144);
        REQUIRE(game.GetTargetFPS() == 144);
        REQUIRE_THROWS_AS(GX::SetMaxFPS(game, -1), InvalidOperationError);
    }
}
