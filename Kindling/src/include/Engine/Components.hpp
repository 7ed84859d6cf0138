#pragma once

#include <Engine/Entity.hpp>
#include <GFX/RenderModel.hpp>
#include <raylib.h>
#include <cstdint>
#include <memory>
#include <string>

namespace Kindling {

class Game;

enum class RenderGroup : uint8_t {
    Group0,  Group1,  Group2,  Group3,  Group4,  Group5,  Group6,  Group7,
    Group8,  Group9,  Group10, Group11, Group12, Group13, Group14, Group15,
    Group16, Group17, Group18, Group19, Group20, Group21, Group22, Group23,
    Group24, Group25, Group26, Group27, Group28, Group29, Group30, Group31,
};

using RenderGroupMask = uint32_t;
inline constexpr RenderGroupMask RenderGroupMaskAll = 0xFFFFFFFFu;

inline constexpr RenderGroupMask MaskOf(RenderGroup g) { return 1u << (uint32_t)g; }

class ModelComponent : public EntityComponent {
public:
    ModelComponent() = default;
    explicit ModelComponent(std::shared_ptr<GFX::RenderModel> m, RenderGroup group = RenderGroup::Group0)
        : model(std::move(m)), renderGroup(group) {}

    std::shared_ptr<GFX::RenderModel> model;
    RenderGroup renderGroup = RenderGroup::Group0;
    bool        visible     = true;
    Color       tint        = WHITE;
};

enum class CameraProjectionMode { Perspective, Orthographic };

class CameraComponent : public EntityComponent {
public:
    CameraProjectionMode projection       = CameraProjectionMode::Perspective;
    float                verticalFov      = 45.0f;   // degrees
    float                orthographicSize = 10.0f;   // visible height in world units
    float                nearClip         = 0.1f;
    float                farClip          = 1000.0f;
    std::string          slot;                       // compositor slot, empty = unassigned
    RenderGroupMask      renderMask       = RenderGroupMaskAll;
    bool                 enabled          = true;

    // raylib camera looking down the entity's -Z axis.
    Camera3D ToCamera3D() const;

    Vector3 Forward() const;

    // Ray from the camera through a screen point.
    Ray ScreenPointToRay(Vector2 screen, int width, int height) const;
};

enum class LightType { Directional, Ambient, Skybox, Point };
enum class ShadowMapSize { Small, Medium, Large, XLarge };

class LightComponent : public EntityComponent {
public:
    LightType     type          = LightType::Directional;
    Color         color         = WHITE;
    float         intensity     = 1.0f;
    bool          shadowEnabled = false;
    ShadowMapSize shadowSize    = ShadowMapSize::Medium;
    int           pcfFilterSize = 0;   // 0 = unfiltered, otherwise N×N PCF

    // Direction the light travels (the entity's -Z axis).
    Vector3 Direction() const;
};

// Clear colour gradient, optionally replaced by a texture.
class BackgroundComponent : public EntityComponent {
public:
    Color       top         = { 58, 86, 130, 255 };
    Color       bottom      = { 180, 196, 214, 255 };
    std::string texturePath;
    float       intensity   = 1.0f;
};

// Axis triad drawn at the entity's position.
class GizmoComponent : public EntityComponent {
public:
    float size            = 1.0f;
    bool  showAxisName    = false;
    bool  rotateAxisNames = true;
};

// Per-frame behaviour attached to an entity. Start runs once before the
// first Update; Draw3D runs inside the 3D pass, DrawOverlay after it.
class ScriptComponent : public EntityComponent {
public:
    virtual void Start(Game&) {}
    virtual void Update(Game&) {}
    virtual void Draw3D(Game&) {}
    virtual void DrawOverlay(Game&) {}

    bool started = false;
    bool enabled = true;
};

} // namespace Kindling
