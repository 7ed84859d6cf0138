#include <Scripts/CameraControllers.hpp>
#include <Engine/Game.hpp>
#include <raymath.h>
#include <cmath>

namespace Kindling {

// ─── BasicCameraController ────────────────────────────────────────────────────
void BasicCameraController::Start(Game&)
{
    Entity* e = GetEntity();
    if (!e) return;

    // Recover yaw / pitch from the current facing so the first drag does not snap.
    Vector3 fwd = Vector3RotateByQuaternion({ 0, 0, -1 }, e->transform.rotation);
    m_pitch = asinf(Clamp(fwd.y, -1.0f, 1.0f)) * RAD2DEG;
    m_yaw   = atan2f(-fwd.x, -fwd.z) * RAD2DEG;
}

void BasicCameraController::Update(Game& game)
{
    Entity* e = GetEntity();
    if (!e) return;

    const Input::InputSource& in = game.GetInput();
    const float dt = game.GetTime().elapsed;

    if (in.IsMouseButtonDown(MOUSE_BUTTON_RIGHT)) {
        Vector2 md = in.MouseDelta();
        m_yaw   -= md.x * mouseSensitivity;
        m_pitch -= md.y * mouseSensitivity;
        m_pitch  = Clamp(m_pitch, -89.0f, 89.0f);
    }
    e->transform.rotation = Transform::YawPitchRoll(m_yaw, m_pitch);

    Vector3 forward = Vector3RotateByQuaternion({ 0, 0, -1 }, e->transform.rotation);
    Vector3 right   = Vector3RotateByQuaternion({ 1, 0, 0 }, e->transform.rotation);

    Vector3 move = { 0, 0, 0 };
    if (in.IsKeyDown(KEY_W) || in.IsKeyDown(KEY_UP))    move = Vector3Add(move, forward);
    if (in.IsKeyDown(KEY_S) || in.IsKeyDown(KEY_DOWN))  move = Vector3Subtract(move, forward);
    if (in.IsKeyDown(KEY_D) || in.IsKeyDown(KEY_RIGHT)) move = Vector3Add(move, right);
    if (in.IsKeyDown(KEY_A) || in.IsKeyDown(KEY_LEFT))  move = Vector3Subtract(move, right);
    if (in.IsKeyDown(KEY_E)) move.y += 1.0f;
    if (in.IsKeyDown(KEY_Q)) move.y -= 1.0f;

    float speed = moveSpeed * (in.IsKeyDown(KEY_LEFT_SHIFT) ? speedMultiplier : 1.0f);
    if (Vector3LengthSqr(move) > 0.0001f)
        e->transform.position = Vector3Add(e->transform.position, Vector3Scale(Vector3Normalize(move), speed * dt));

    float wheel = in.MouseWheel();
    if (wheel != 0.0f)
        e->transform.position = Vector3Add(e->transform.position, Vector3Scale(forward, wheel * wheelStep));
}

// ─── Camera2DController ───────────────────────────────────────────────────────
void Camera2DController::Update(Game& game)
{
    Entity* e = GetEntity();
    if (!e) return;
    auto* cam = e->Get<CameraComponent>();

    const Input::InputSource& in = game.GetInput();
    const float dt = game.GetTime().elapsed;

    Vector2 pan = { 0, 0 };
    if (in.IsKeyDown(KEY_W) || in.IsKeyDown(KEY_UP))    pan.y += 1.0f;
    if (in.IsKeyDown(KEY_S) || in.IsKeyDown(KEY_DOWN))  pan.y -= 1.0f;
    if (in.IsKeyDown(KEY_D) || in.IsKeyDown(KEY_RIGHT)) pan.x += 1.0f;
    if (in.IsKeyDown(KEY_A) || in.IsKeyDown(KEY_LEFT))  pan.x -= 1.0f;
    if (Vector2LengthSqr(pan) > 0.0001f) {
        pan = Vector2Scale(Vector2Normalize(pan), panSpeed * dt);
        e->transform.position.x += pan.x;
        e->transform.position.y += pan.y;
    }

    if (cam && in.IsMouseButtonDown(MOUSE_BUTTON_RIGHT)) {
        // One screen pixel in world units at the current zoom.
        float unitsPerPixel = cam->orthographicSize / (float)game.ScreenHeight();
        Vector2 md = in.MouseDelta();
        e->transform.position.x -= md.x * unitsPerPixel;
        e->transform.position.y += md.y * unitsPerPixel;
    }

    float wheel = in.MouseWheel();
    if (cam && wheel != 0.0f) {
        float size = wheel > 0.0f ? cam->orthographicSize / zoomStep : cam->orthographicSize * zoomStep;
        cam->orthographicSize = Clamp(size, minSize, maxSize);
    }
}

} // namespace Kindling
