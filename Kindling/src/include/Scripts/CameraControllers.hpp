#pragma once

#include <Engine/Components.hpp>
#include <raylib.h>

namespace Kindling {

// Free-fly camera: WASD / arrows move, Q and E go down and up, Left Shift
// speeds up, right mouse button drag looks around, wheel moves along the view.
class BasicCameraController : public ScriptComponent {
public:
    float moveSpeed        = 5.0f;    // units per second
    float speedMultiplier  = 3.0f;    // while Left Shift is held
    float mouseSensitivity = 0.15f;   // degrees per pixel
    float wheelStep        = 1.0f;

    void Start(Game& game) override;
    void Update(Game& game) override;

    float GetYaw() const   { return m_yaw; }
    float GetPitch() const { return m_pitch; }

private:
    float m_yaw   = 0.0f;   // degrees
    float m_pitch = 0.0f;   // degrees
};

// Orthographic pan / zoom: WASD / arrows or right mouse drag pan, wheel zooms.
class Camera2DController : public ScriptComponent {
public:
    float panSpeed    = 8.0f;    // units per second
    float zoomStep    = 1.1f;    // orthographic size factor per wheel notch
    float minSize     = 1.0f;
    float maxSize     = 200.0f;

    void Update(Game& game) override;
};

} // namespace Kindling
