#include <Engine/Components.hpp>
#include <raymath.h>

namespace Kindling {

static Vector3 WorldDirection(const Entity* e, Vector3 local)
{
    if (!e) return local;
    Matrix  world  = e->WorldMatrix();
    Vector3 origin = Vector3Transform({ 0, 0, 0 }, world);
    return Vector3Normalize(Vector3Subtract(Vector3Transform(local, world), origin));
}

Vector3 CameraComponent::Forward() const
{
    return WorldDirection(GetEntity(), { 0, 0, -1 });
}

Camera3D CameraComponent::ToCamera3D() const
{
    Camera3D cam = {};
    const Entity* e = GetEntity();
    cam.position   = e ? e->WorldPosition() : Vector3{ 0, 0, 0 };
    cam.target     = Vector3Add(cam.position, Forward());
    cam.up         = WorldDirection(e, { 0, 1, 0 });
    cam.projection = projection == CameraProjectionMode::Perspective ? CAMERA_PERSPECTIVE : CAMERA_ORTHOGRAPHIC;
    cam.fovy       = projection == CameraProjectionMode::Perspective ? verticalFov : orthographicSize;
    return cam;
}

Ray CameraComponent::ScreenPointToRay(Vector2 screen, int width, int height) const
{
    return GetScreenToWorldRayEx(screen, ToCamera3D(), width, height);
}

Vector3 LightComponent::Direction() const
{
    return WorldDirection(GetEntity(), { 0, 0, -1 });
}

} // namespace Kindling
