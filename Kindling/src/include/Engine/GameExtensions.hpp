#pragma once

// ── Kindling::GameExtensions ────────────────────────────────────────────────
//
// One-call helpers for putting a playable scene together. Every helper that
// creates something attaches it to the game's root scene and returns the raw
// entity pointer (the scene owns it), except the Create*Primitive* family,
// which return a detached entity for the caller to place.
//
//   Kindling::Game game(settings);
//   GameExtensions::Run(game, [&](Kindling::Scene& scene) {
//       GameExtensions::SetupBase3DScene(game);
//       auto cube = GameExtensions::CreatePrimitive(game, GFX::PrimitiveModelType::Cube);
//       cube->transform.position = { 0, 8, 0 };
//       scene.Add(cube);
//   });

#include <Engine/Components.hpp>
#include <Engine/Game.hpp>
#include <Engine/Scheduler.hpp>
#include <GFX/Material.hpp>
#include <GFX/ProceduralModels.hpp>
#include <Physics/PhysicsComponents.hpp>
#include <raylib.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Kindling::GameExtensions {

inline constexpr const char* DefaultGroundName     = "Ground";
inline constexpr const char* DefaultCameraName     = "Main";
inline constexpr Vector2     Default3DGroundSize   = { 15.0f, 15.0f };
inline constexpr Vector3     Default2DGroundSize   = { 15.0f, 0.1f, 0.0f };
inline constexpr Vector3     Initial3DCameraPosition = { 6.0f, 6.0f, 6.0f };
inline constexpr Vector3     Initial3DCameraRotation = { 45.0f, -30.0f, 0.0f };   // yaw, pitch, roll
inline constexpr Vector3     Initial2DCameraPosition = { 0.0f, 0.0f, 50.0f };
inline constexpr Vector3     Initial2DCameraRotation = { 0.0f, 0.0f, 0.0f };
inline constexpr const char* SkyboxTexturePath     = "Resources/skybox_texture.png";

// ─── Creation options ─────────────────────────────────────────────────────────

struct PrimitiveCreationOptions {
    std::string                      entityName;        // empty = "Entity"
    std::optional<GFX::MaterialDesc> material;
    bool                             includeCollider = true;
    RenderGroup                      renderGroup     = RenderGroup::Group0;
};

struct Primitive3DCreationOptions : PrimitiveCreationOptions {
    std::optional<Vector3> size;
    bool                   is2D = false;

    // Receives the mapped collider. nullptr = no physics.
    std::shared_ptr<Physics::ColliderComponent> physicsComponent = std::make_shared<Physics::RigidbodyComponent>();
};

struct Primitive2DCreationOptions : PrimitiveCreationOptions {
    std::optional<Vector2> size;
    float                  depth = GFX::DefaultShapeDepth;

    std::shared_ptr<Physics::ColliderComponent> physicsComponent = std::make_shared<Physics::RigidbodyComponent>();
};

struct Primitive3DCreationOptionsCompound : PrimitiveCreationOptions {
    std::optional<Vector3> size;

    // The mapped collider is appended to component->collider.colliders.
    std::shared_ptr<Physics::CollidableComponent> component = std::make_shared<Physics::BodyComponent>();
};

struct Primitive2DCreationOptionsCompound : PrimitiveCreationOptions {
    std::optional<Vector2> size;
    float                  depth = GFX::DefaultShapeDepth;

    std::shared_ptr<Physics::CollidableComponent> component = std::make_shared<Physics::Body2DComponent>();
};

// ─── Frame loop ───────────────────────────────────────────────────────────────

using SceneStart  = std::function<void(Scene&)>;
using SceneUpdate = std::function<void(Scene&, const GameTime&)>;
using GameStart   = std::function<void(Game&)>;
using GameUpdate  = std::function<void(Game&)>;

// Register the root script without running the loop: `start` on the first
// tick, then `update` once per frame until the token is cancelled. With no
// `update` the script finishes after `start`.
CancellationToken Schedule(Game& game, SceneStart start, SceneUpdate update = {});
CancellationToken Schedule(Game& game, GameStart start, GameUpdate update = {});
void Schedule(Game& game, CancellationToken token, SceneStart start, SceneUpdate update = {});

// Schedule + Game::Run(). Returns when the loop ends.
void Run(Game& game, SceneStart start = {}, SceneUpdate update = {});
void Run(Game& game, GameStart start, GameUpdate update = {});

// Same, with a token the caller can cancel to stop calling `update`.
void Run(Game& game, CancellationToken token, SceneStart start, SceneUpdate update = {});

// ─── Scene setup ──────────────────────────────────────────────────────────────

// Compositor with a UI stage, 3D camera and directional light.
void SetupBase(Game& game);

// SetupBase plus camera controller, skybox and a 15×15 ground plane.
void SetupBase3DScene(Game& game);

// Orthographic camera with a 2D controller, skybox and a thin 2D ground box.
void SetupBase2DScene(Game& game);

// SetupBase3DScene with a compound-collider ground.
void SetupBase3DSceneCompound(Game& game);

// Replaces the game's compositor with a default one.
GraphicsCompositor& AddGraphicsCompositor(Game& game);
GraphicsCompositor& AddCleanUIStage(GraphicsCompositor& compositor);

// Perspective camera bound to the compositor's first slot, which is renamed
// to `cameraName`. Rotation is yaw / pitch / roll in degrees.
// Throws InvalidOperationError when the compositor has no camera slot.
Entity* Add3DCamera(Game& game, const std::string& cameraName = DefaultCameraName,
                    std::optional<Vector3> initialPosition = std::nullopt,
                    std::optional<Vector3> initialRotation = std::nullopt,
                    CameraProjectionMode projection = CameraProjectionMode::Perspective);

Entity* Add2DCamera(Game& game, const std::string& cameraName = DefaultCameraName,
                    std::optional<Vector3> initialPosition = std::nullopt,
                    std::optional<Vector3> initialRotation = std::nullopt);

Entity* Add3DCameraController(Entity* camera);
Entity* Add2DCameraController(Entity* camera);

Entity* AddDirectionalLight(Game& game, const std::string& entityName = "");

// Five white directional lights at (7, 2, 0) covering every side.
void AddAllDirectionLighting(Game& game, float intensity, bool showLightGizmo = true);

// Background from Resources/skybox_texture.png beside the executable (a
// gradient when missing) plus a skybox light.
Entity* AddSkybox(Game& game, const std::string& entityName = "");

Entity* Add3DGround(Game& game, const std::string& entityName = DefaultGroundName,
                    std::optional<Vector2> size = std::nullopt, bool includeCollider = true);
Entity* AddInfinite3DGround(Game& game, const std::string& entityName = DefaultGroundName,
                            std::optional<Vector2> size = std::nullopt, bool includeCollider = true);
Entity* Add3DGroundCompound(Game& game, const std::string& entityName = DefaultGroundName,
                            std::optional<Vector2> size = std::nullopt, bool includeCollider = true);
Entity* Add2DGround(Game& game, const std::string& entityName = DefaultGroundName,
                    std::optional<Vector2> size = std::nullopt);

// Gizmo child on the root entity named "Ground". No-op without one.
void AddGroundGizmo(Game& game, std::optional<Vector3> position = std::nullopt,
                    bool showAxisName = false, bool rotateAxisNames = true);

GizmoComponent& AddGizmo(Entity& entity, float size = 1.0f, bool showAxisName = false,
                         bool rotateAxisNames = true);

// ─── Time / diagnostics ───────────────────────────────────────────────────────

float  DeltaTime(const Game& game);
double DeltaTimeAccurate(const Game& game);
float  FPS(const Game& game);

// 0 = uncapped. Throws InvalidOperationError for a negative rate.
void SetMaxFPS(Game& game, int targetFPS);

Entity* AddProfiler(Game& game, const std::string& entityName = "");
void    ShowColliders(Game& game);

// ─── Primitives ───────────────────────────────────────────────────────────────

GFX::MaterialDesc CreateMaterial(const Game& game, std::optional<Color> color = std::nullopt,
                                 float specular = 1.0f, float microSurface = 0.65f);

std::shared_ptr<Entity> CreatePrimitive(Game& game, GFX::PrimitiveModelType type,
                                        const Primitive3DCreationOptions& options = {});
std::shared_ptr<Entity> Create2DPrimitive(Game& game, GFX::Primitive2DModelType type,
                                          const Primitive2DCreationOptions& options = {});
std::shared_ptr<Entity> CreatePrimitiveCompound(Game& game, GFX::PrimitiveModelType type,
                                                const Primitive3DCreationOptionsCompound& options = {});
std::shared_ptr<Entity> Create2DPrimitiveCompound(Game& game, GFX::Primitive2DModelType type,
                                                  const Primitive2DCreationOptionsCompound& options = {});

} // namespace Kindling::GameExtensions
