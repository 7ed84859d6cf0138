#include <Engine/GameExtensions.hpp>
#include <Core/AssetPath.hpp>
#include <Core/Error.hpp>
#include <GFX/RenderModel.hpp>
#include <Physics/ColliderMapping.hpp>
#include <Scripts/CameraControllers.hpp>
#include <Scripts/GameProfiler.hpp>
#include <raymath.h>

namespace Kindling::GameExtensions {

using GFX::PrimitiveModelType;
using GFX::Primitive2DModelType;

// ─── Frame loop ───────────────────────────────────────────────────────────────

void Schedule(Game& game, CancellationToken token, SceneStart start, SceneUpdate update)
{
    bool started = false;
    game.GetScheduler().Add(
        [&game, started, start = std::move(start), update = std::move(update)]() mutable {
            Scene& scene = game.GetRootScene();
            if (!started) {
                started = true;
                if (start) start(scene);
                if (!update) return TaskStatus::Finished;
            }
            update(scene, game.GetTime());
            return TaskStatus::Continue;
        },
        std::move(token), "RootScript");
}

CancellationToken Schedule(Game& game, SceneStart start, SceneUpdate update)
{
    CancellationToken token;
    Schedule(game, token, std::move(start), std::move(update));
    return token;
}

CancellationToken Schedule(Game& game, GameStart start, GameUpdate update)
{
    SceneStart  s;
    SceneUpdate u;
    if (start)  s = [&game, start = std::move(start)](Scene&) { start(game); };
    if (update) u = [&game, update = std::move(update)](Scene&, const GameTime&) { update(game); };
    return Schedule(game, std::move(s), std::move(u));
}

void Run(Game& game, SceneStart start, SceneUpdate update)
{
    Schedule(game, std::move(start), std::move(update));
    game.Run();
}

void Run(Game& game, GameStart start, GameUpdate update)
{
    Schedule(game, std::move(start), std::move(update));
    game.Run();
}

void Run(Game& game, CancellationToken token, SceneStart start, SceneUpdate update)
{
    Schedule(game, std::move(token), std::move(start), std::move(update));
    game.Run();
}

// ─── Scene setup ──────────────────────────────────────────────────────────────

void SetupBase(Game& game)
{
    AddCleanUIStage(AddGraphicsCompositor(game));
    Add3DCamera(game);
    AddDirectionalLight(game);
}

void SetupBase3DScene(Game& game)
{
    AddCleanUIStage(AddGraphicsCompositor(game));
    Add3DCameraController(Add3DCamera(game));
    AddDirectionalLight(game);
    AddSkybox(game);
    Add3DGround(game);
}

void SetupBase2DScene(Game& game)
{
    AddCleanUIStage(AddGraphicsCompositor(game));
    Add2DCameraController(Add2DCamera(game));
    AddSkybox(game);
    Add2DGround(game);
}

void SetupBase3DSceneCompound(Game& game)
{
    AddCleanUIStage(AddGraphicsCompositor(game));
    Add3DCameraController(Add3DCamera(game));
    AddDirectionalLight(game);
    AddSkybox(game);
    Add3DGroundCompound(game);
}

GraphicsCompositor& AddGraphicsCompositor(Game& game)
{
    auto compositor = GraphicsCompositor::CreateDefault();
    compositor->postEffects = true;
    game.SetCompositor(compositor);
    return *compositor;
}

GraphicsCompositor& AddCleanUIStage(GraphicsCompositor& compositor)
{
    compositor.uiStage = true;
    return compositor;
}

// ─── Cameras ──────────────────────────────────────────────────────────────────

Entity* Add3DCamera(Game& game, const std::string& cameraName, std::optional<Vector3> initialPosition,
                    std::optional<Vector3> initialRotation, CameraProjectionMode projection)
{
    const auto& compositor = game.GetCompositor();
    if (!compositor || compositor->cameraSlots.empty())
        throw InvalidOperationError("Cannot add camera: The GraphicsCompositor does not have any camera slots defined.");

    compositor->cameraSlots[0] = cameraName;

    Vector3 pos = initialPosition.value_or(Initial3DCameraPosition);
    Vector3 rot = initialRotation.value_or(Initial3DCameraRotation);

    auto entity = std::make_shared<Entity>(cameraName);
    auto camera = entity->Add<CameraComponent>();
    camera->projection = projection;
    camera->slot       = cameraName;

    entity->transform.position = pos;
    entity->transform.rotation = Transform::YawPitchRoll(rot.x, rot.y, rot.z);

    TraceLog(LOG_DEBUG, "[GameExtensions] Camera '%s' at (%.1f, %.1f, %.1f)", cameraName.c_str(), pos.x, pos.y, pos.z);
    return game.GetRootScene().Add(std::move(entity));
}

Entity* Add2DCamera(Game& game, const std::string& cameraName, std::optional<Vector3> initialPosition,
                    std::optional<Vector3> initialRotation)
{
    return Add3DCamera(game, cameraName,
                       initialPosition.value_or(Initial2DCameraPosition),
                       initialRotation.value_or(Initial2DCameraRotation),
                       CameraProjectionMode::Orthographic);
}

Entity* Add3DCameraController(Entity* camera)
{
    if (camera) camera->Add<BasicCameraController>();
    return camera;
}

Entity* Add2DCameraController(Entity* camera)
{
    if (camera) camera->Add<Camera2DController>();
    return camera;
}

// ─── Lights / background ──────────────────────────────────────────────────────

Entity* AddDirectionalLight(Game& game, const std::string& entityName)
{
    auto entity = std::make_shared<Entity>(entityName);
    auto light  = entity->Add<LightComponent>();
    light->type          = LightType::Directional;
    light->intensity     = 20.0f;
    light->shadowEnabled = true;
    light->shadowSize    = ShadowMapSize::Large;
    light->pcfFilterSize = 5;

    // X first, then Y.
    Quaternion rx = QuaternionFromAxisAngle({ 1, 0, 0 }, -30.0f * DEG2RAD);
    Quaternion ry = QuaternionFromAxisAngle({ 0, 1, 0 }, -180.0f * DEG2RAD);
    entity->transform.position = { 0.0f, 2.0f, 0.0f };
    entity->transform.rotation = QuaternionMultiply(ry, rx);

    return game.GetRootScene().Add(std::move(entity));
}

void AddAllDirectionLighting(Game& game, float intensity, bool showLightGizmo)
{
    const Vector3 position = { 7.0f, 2.0f, 0.0f };
    const Quaternion rotations[] = {
        QuaternionIdentity(),
        QuaternionFromAxisAngle({ 1, 0, 0 }, 180.0f * DEG2RAD),
        QuaternionFromAxisAngle({ 1, 0, 0 }, 270.0f * DEG2RAD),
        QuaternionFromAxisAngle({ 0, 1, 0 },  90.0f * DEG2RAD),
        QuaternionFromAxisAngle({ 0, 1, 0 }, 270.0f * DEG2RAD),
    };

    for (const Quaternion& q : rotations) {
        auto entity = std::make_shared<Entity>();
        auto light  = entity->Add<LightComponent>();
        light->type      = LightType::Directional;
        light->color     = WHITE;
        light->intensity = intensity;

        entity->transform.position = position;
        entity->transform.rotation = q;
        if (showLightGizmo) AddGizmo(*entity, 0.5f);

        game.GetRootScene().Add(std::move(entity));
    }
}

Entity* AddSkybox(Game& game, const std::string& entityName)
{
    auto entity = std::make_shared<Entity>(entityName);

    auto background = entity->Add<BackgroundComponent>();
    background->intensity   = 1.0f;
    background->texturePath = ResolveAssetPath(SkyboxTexturePath);
    if (!FileExists(background->texturePath.c_str())) {
        TraceLog(LOG_INFO, "[GameExtensions] No skybox texture at %s, using gradient", background->texturePath.c_str());
        background->texturePath.clear();
    }

    auto light = entity->Add<LightComponent>();
    light->type      = LightType::Skybox;
    light->intensity = 1.0f;

    entity->transform.position = { 0.0f, 2.0f, -2.0f };
    return game.GetRootScene().Add(std::move(entity));
}

// ─── Grounds ──────────────────────────────────────────────────────────────────

static GFX::MaterialDesc GroundMaterial(const Game& game)
{
    return CreateMaterial(game, GFX::DefaultGroundMaterialColor, 0.0f, 0.1f);
}

static Entity* CreateGround(Game& game, const std::string& entityName, std::optional<Vector2> size,
                            bool includeCollider, PrimitiveModelType type)
{
    Vector2 s = size.value_or(Default3DGroundSize);

    Primitive3DCreationOptions options;
    options.entityName       = entityName;
    options.material         = GroundMaterial(game);
    options.includeCollider  = includeCollider;
    options.size             = Vector3{ s.x, s.y, 0.0f };
    options.physicsComponent = std::make_shared<Physics::StaticColliderComponent>();

    return game.GetRootScene().Add(CreatePrimitive(game, type, options));
}

Entity* Add3DGround(Game& game, const std::string& entityName, std::optional<Vector2> size, bool includeCollider)
{
    return CreateGround(game, entityName, size, includeCollider, PrimitiveModelType::Plane);
}

Entity* AddInfinite3DGround(Game& game, const std::string& entityName, std::optional<Vector2> size, bool includeCollider)
{
    return CreateGround(game, entityName, size, includeCollider, PrimitiveModelType::InfinitePlane);
}

Entity* Add3DGroundCompound(Game& game, const std::string& entityName, std::optional<Vector2> size, bool includeCollider)
{
    Vector2 s = size.value_or(Default3DGroundSize);

    Primitive3DCreationOptionsCompound options;
    options.entityName      = entityName;
    options.material        = GroundMaterial(game);
    options.includeCollider = includeCollider;
    options.size            = Vector3{ s.x, s.y, 0.0f };
    options.component       = std::make_shared<Physics::StaticComponent>();

    return game.GetRootScene().Add(CreatePrimitiveCompound(game, PrimitiveModelType::Plane, options));
}

Entity* Add2DGround(Game& game, const std::string& entityName, std::optional<Vector2> size)
{
    Vector3 s = size ? Vector3{ size->x, size->y, 0.0f } : Default2DGroundSize;

    auto model = std::make_shared<GFX::RenderModel>(GFX::Procedural3DModelBuilder::Build(PrimitiveModelType::Cube, s));
    model->AddMaterial(GroundMaterial(game));

    auto entity = std::make_shared<Entity>(entityName);
    entity->Add<ModelComponent>(model);

    auto collider = entity->Add<Physics::StaticColliderComponent>();
    collider->colliderShapes.push_back(Physics::ColliderShapeDesc::Box(s, true));

    return game.GetRootScene().Add(std::move(entity));
}

GizmoComponent& AddGizmo(Entity& entity, float size, bool showAxisName, bool rotateAxisNames)
{
    auto gizmo = entity.Add<GizmoComponent>();
    gizmo->size            = size;
    gizmo->showAxisName    = showAxisName;
    gizmo->rotateAxisNames = rotateAxisNames;
    return *gizmo;
}

void AddGroundGizmo(Game& game, std::optional<Vector3> position, bool showAxisName, bool rotateAxisNames)
{
    Entity* ground = game.GetRootScene().FindFirst(DefaultGroundName);
    if (!ground) return;

    auto gizmo = std::make_shared<Entity>("Gizmo");
    AddGizmo(*gizmo, 1.0f, showAxisName, rotateAxisNames);
    gizmo->transform.position = position.value_or(Vector3{ 0, 0, 0 });
    ground->AddChild(std::move(gizmo));
}

// ─── Time / diagnostics ───────────────────────────────────────────────────────

float DeltaTime(const Game& game)
{
    return game.GetTime().elapsed;
}

double DeltaTimeAccurate(const Game& game)
{
    return game.GetTime().elapsedAccurate;
}

float FPS(const Game& game)
{
    return game.GetTime().framesPerSecond;
}

void SetMaxFPS(Game& game, int targetFPS)
{
    if (targetFPS < 0)
        throw InvalidOperationError("Target FPS must not be negative");
    game.SetTargetFPS(targetFPS);
}

Entity* AddProfiler(Game& game, const std::string& entityName)
{
    auto entity = std::make_shared<Entity>(entityName.empty() ? "Profiler" : entityName);
    entity->Add<GameProfiler>();
    return game.GetRootScene().Add(std::move(entity));
}

void ShowColliders(Game& game)
{
    game.GetRenderer().showColliders = true;
}

// ─── Primitives ───────────────────────────────────────────────────────────────

GFX::MaterialDesc CreateMaterial(const Game&, std::optional<Color> color, float specular, float microSurface)
{
    return GFX::CreateMaterial(color, specular, microSurface);
}

static std::shared_ptr<Entity> WrapModel(GFX::MeshData mesh, const PrimitiveCreationOptions& options)
{
    auto model = std::make_shared<GFX::RenderModel>(std::move(mesh));
    if (options.material) model->AddMaterial(*options.material);

    auto entity = std::make_shared<Entity>(options.entityName.empty() ? "Entity" : options.entityName);
    entity->Add<ModelComponent>(model, options.renderGroup);
    return entity;
}

// Circles are built along +Y and turned to face the 2D camera.
static void Orient2D(Entity& entity, Primitive2DModelType type)
{
    if (type == Primitive2DModelType::Circle)
        entity.transform.rotation = QuaternionFromAxisAngle({ 1, 0, 0 }, 90.0f * DEG2RAD);
}

std::shared_ptr<Entity> CreatePrimitive(Game&, PrimitiveModelType type, const Primitive3DCreationOptions& options)
{
    auto entity = WrapModel(GFX::Procedural3DModelBuilder::Build(type, options.size), options);

    if (!options.includeCollider || !options.physicsComponent) return entity;

    auto shape = Physics::Get3DColliderShape(type, options.size, options.is2D);
    if (!shape) return entity;

    options.physicsComponent->colliderShapes.push_back(*shape);
    entity->Add(options.physicsComponent);
    return entity;
}

std::shared_ptr<Entity> Create2DPrimitive(Game&, Primitive2DModelType type, const Primitive2DCreationOptions& options)
{
    auto entity = WrapModel(GFX::Procedural2DModelBuilder::Build(type, options.size, options.depth), options);
    Orient2D(*entity, type);

    if (!options.includeCollider || !options.physicsComponent) return entity;

    if (type == Primitive2DModelType::Triangle)
        options.physicsComponent->colliderShapes.push_back(Physics::CreateTriangleHull(options.size, options.depth));
    else
        options.physicsComponent->colliderShapes.push_back(Physics::Get2DColliderShape(type, options.size, options.depth));

    entity->Add(options.physicsComponent);
    return entity;
}

std::shared_ptr<Entity> CreatePrimitiveCompound(Game&, PrimitiveModelType type, const Primitive3DCreationOptionsCompound& options)
{
    auto entity = WrapModel(GFX::Procedural3DModelBuilder::Build(type, options.size), options);

    if (!options.includeCollider || !options.component) return entity;

    options.component->collider.colliders.push_back(Physics::Get3DColliderShapeCompound(type, options.size));
    entity->Add(options.component);
    return entity;
}

std::shared_ptr<Entity> Create2DPrimitiveCompound(Game&, Primitive2DModelType type, const Primitive2DCreationOptionsCompound& options)
{
    auto entity = WrapModel(GFX::Procedural2DModelBuilder::Build(type, options.size, options.depth), options);
    Orient2D(*entity, type);

    if (!options.includeCollider || !options.component) return entity;

    options.component->collider.colliders.push_back(Physics::Get2DColliderShapeCompound(type, options.size, options.depth));
    entity->Add(options.component);
    return entity;
}

} // namespace Kindling::GameExtensions
