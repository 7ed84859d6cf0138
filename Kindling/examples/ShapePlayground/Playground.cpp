#include "Playground.hpp"
#include <Engine/Components.hpp>
#include <Engine/GameExtensions.hpp>
#include <Physics/PhysicsComponents.hpp>
#include <raylib.h>

using namespace Kindling;
using GFX::Primitive2DModelType;

namespace ShapePlayground {

static constexpr Vector3 CubeBoxSize  = { 0.2f, 0.2f, 0.04f };
static constexpr Vector2 CubeFaceSize = { 0.2f, 0.2f };
static constexpr int     NavX = 5;
static constexpr int     NavY = 30;

static Vector3 RandomShapePosition()
{
    return { (float)GetRandomValue(-5, 4), 3.0f + (float)GetRandomValue(0, 6), 0.0f };
}

Playground::Playground(Game& game, ShapeCatalog catalog)
    : m_game(game)
    , m_catalog(std::move(catalog))
{
}

void Playground::Start(Scene& scene)
{
    m_game.SetResizable(true);
    m_game.SetWindowTitle("2D Example");

    GameExtensions::SetupBase3DSceneCompound(m_game);
    GameExtensions::AddProfiler(m_game);
    GameExtensions::AddAllDirectionLighting(m_game, 5.0f, true);

    auto simulation2D = std::make_shared<Entity>("Simulation2D");
    GameExtensions::AddGizmo(*simulation2D, 1.0f, true);
    scene.Add(std::move(simulation2D));

    auto capsule = GameExtensions::CreatePrimitive(m_game, GFX::PrimitiveModelType::Capsule);
    capsule->transform.position = { 0.0f, 20.0f, 0.0f };
    scene.Add(std::move(capsule));

    m_cubeModel = std::make_shared<GFX::RenderModel>(
        GFX::Procedural2DModelBuilder::Build(Primitive2DModelType::Square, CubeFaceSize, GFX::DefaultShapeDepth));
    m_cubeModel->AddMaterial(GameExtensions::CreateMaterial(m_game));

    GenerateCubes(scene);
    RefreshCubeCount(scene);
}

void Playground::Update(Scene& scene, const GameTime&)
{
    const Input::InputSource& in = m_game.GetInput();

    if (in.IsKeyDown(KEY_SPACE)) {
        GenerateCubes(scene);
        RefreshCubeCount(scene);
    }

    if (in.IsKeyPressed(KEY_M))      Add2DShapes(scene, Primitive2DModelType::Square);
    else if (in.IsKeyPressed(KEY_R)) Add2DShapes(scene, Primitive2DModelType::Rectangle);
    else if (in.IsKeyPressed(KEY_C)) Add2DShapes(scene, Primitive2DModelType::Circle);
    else if (in.IsKeyPressed(KEY_T)) Add2DShapes(scene, Primitive2DModelType::Triangle);
    else if (in.IsKeyPressed(KEY_P)) Add2DShapes(scene, std::nullopt);
    else if (in.IsKeyReleased(KEY_X)) DeleteAll(scene);

    RenderNavigation();
}

void Playground::GenerateCubes(Scene& scene, int count)
{
    for (int i = 0; i < count; ++i) {
        auto cube = std::make_shared<Entity>(CubeEntityName);
        if (m_cubeModel) cube->Add<ModelComponent>(m_cubeModel, RenderGroup::Group0);
        cube->transform.position = { (float)GetRandomValue(-5, 4), (float)GetRandomValue(10, 29), 0.0f };

        auto body = cube->Add<Physics::Body2DComponent>();
        body->collider.colliders.push_back(Physics::ColliderShapeDesc::Box(CubeBoxSize));

        scene.Add(std::move(cube));
    }
}

Entity* Playground::SpawnShape(Scene& scene, Shape2DModel& shape)
{
    std::shared_ptr<Entity> entity;

    if (shape.type == Primitive2DModelType::Triangle) {
        // Hull colliders only fit the flat collider list.
        GameExtensions::Primitive2DCreationOptions options;
        options.size     = shape.size;
        options.material = GameExtensions::CreateMaterial(m_game, shape.color);
        entity = GameExtensions::Create2DPrimitive(m_game, shape.type, options);

        if (auto* body = entity->Get<Physics::RigidbodyComponent>()) {
            body->angularFactor = { 0, 0, 1 };
            body->linearFactor  = { 1, 1, 0 };
        }
    } else {
        GameExtensions::Primitive2DCreationOptionsCompound options;
        options.size     = shape.size;
        options.material = GameExtensions::CreateMaterial(m_game, shape.color);
        entity = GameExtensions::Create2DPrimitiveCompound(m_game, shape.type, options);
    }

    if (auto* mc = entity->Get<ModelComponent>()) {
        if (shape.model) mc->model = shape.model;
        else             shape.model = mc->model;
    }

    entity->SetName(ShapeEntityName);
    entity->transform.position = RandomShapePosition();
    return scene.Add(std::move(entity));
}

void Playground::Add2DShapes(Scene& scene, std::optional<Primitive2DModelType> type, int count)
{
    for (int i = 0; i < count; ++i) {
        Shape2DModel* shape = m_catalog.Find(type);
        if (!shape) {
            TraceLog(LOG_WARNING, "[Playground] No shape registered for %s",
                     type ? GFX::ToString(*type) : "random");
            return;
        }
        SpawnShape(scene, *shape);
    }
    RefreshCubeCount(scene);
}

void Playground::DeleteAll(Scene& scene)
{
    std::size_t removed = scene.RemoveAll(CubeEntityName) + scene.RemoveAll(ShapeEntityName);
    TraceLog(LOG_DEBUG, "[Playground] Removed %d entities", (int)removed);
    RefreshCubeCount(scene);
}

void Playground::RefreshCubeCount(const Scene& scene)
{
    m_cubes = (int)scene.Count(CubeEntityName);
}

void Playground::RenderNavigation()
{
    auto& text  = m_game.GetDebugText();
    int   space = 0;

    text.Print("Cubes: " + std::to_string(m_cubes), NavX, NavY);
    space += 30;
    text.Print("X - Delete all cubes and shapes", NavX, NavY + space, RED);
    space += 20;
    text.Print("M - generate 2D squares", NavX, NavY + space);
    space += 20;
    text.Print("R - generate 2D rectangles", NavX, NavY + space);
    space += 20;
    text.Print("C - generate 2D circles", NavX, NavY + space);
    space += 20;
    text.Print("T - generate 2D triangles", NavX, NavY + space);
    space += 20;
    text.Print("P - generate random 2D shapes", NavX, NavY + space);
}

} // namespace ShapePlayground
