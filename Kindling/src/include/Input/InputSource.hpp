#pragma once

// ── Kindling::Input ─────────────────────────────────────────────────────────
//
// Polling facade over keyboard and mouse. Key and button codes are raylib's
// (KEY_SPACE, MOUSE_BUTTON_LEFT, ...).
//
//   RaylibInput    forwards to the live window
//   ScriptedInput  state driven by code, for headless runs and tests

#include <raylib.h>
#include <set>

namespace Kindling::Input {

class InputSource {
public:
    virtual ~InputSource() = default;

    // Called once per frame before any script runs.
    virtual void Poll() {}

    virtual bool IsKeyDown(int key) const     = 0;
    virtual bool IsKeyPressed(int key) const  = 0;
    virtual bool IsKeyReleased(int key) const = 0;

    virtual bool IsMouseButtonDown(int button) const     = 0;
    virtual bool IsMouseButtonPressed(int button) const  = 0;
    virtual bool IsMouseButtonReleased(int button) const = 0;

    virtual Vector2 MousePosition() const = 0;
    virtual Vector2 MouseDelta() const    = 0;
    virtual float   MouseWheel() const    = 0;
};

class RaylibInput : public InputSource {
public:
    bool IsKeyDown(int key) const override     { return ::IsKeyDown(key); }
    bool IsKeyPressed(int key) const override  { return ::IsKeyPressed(key); }
    bool IsKeyReleased(int key) const override { return ::IsKeyReleased(key); }

    bool IsMouseButtonDown(int b) const override     { return ::IsMouseButtonDown(b); }
    bool IsMouseButtonPressed(int b) const override  { return ::IsMouseButtonPressed(b); }
    bool IsMouseButtonReleased(int b) const override { return ::IsMouseButtonReleased(b); }

    Vector2 MousePosition() const override { return GetMousePosition(); }
    Vector2 MouseDelta() const override    { return GetMouseDelta(); }
    float   MouseWheel() const override    { return GetMouseWheelMove(); }
};

class ScriptedInput : public InputSource {
public:
    // Queued changes take effect on the next Poll().
    void PressKey(int key)   { m_keys.PressNext(key); }
    void ReleaseKey(int key) { m_keys.ReleaseNext(key); }
    // Down for exactly one frame, released on the frame after.
    void TapKey(int key)     { m_keys.Tap(key); }

    void PressMouseButton(int b)   { m_buttons.PressNext(b); }
    void ReleaseMouseButton(int b) { m_buttons.ReleaseNext(b); }
    void Click(int b, Vector2 position);

    void SetMousePosition(Vector2 p) { m_nextMouse = p; }
    void SetMouseWheel(float w)      { m_nextWheel = w; }

    void Poll() override;

    bool IsKeyDown(int key) const override     { return m_keys.down.count(key) > 0; }
    bool IsKeyPressed(int key) const override  { return m_keys.pressed.count(key) > 0; }
    bool IsKeyReleased(int key) const override { return m_keys.released.count(key) > 0; }

    bool IsMouseButtonDown(int b) const override     { return m_buttons.down.count(b) > 0; }
    bool IsMouseButtonPressed(int b) const override  { return m_buttons.pressed.count(b) > 0; }
    bool IsMouseButtonReleased(int b) const override { return m_buttons.released.count(b) > 0; }

    Vector2 MousePosition() const override { return m_mouse; }
    Vector2 MouseDelta() const override    { return m_mouseDelta; }
    float   MouseWheel() const override    { return m_wheel; }

private:
    struct ButtonSet {
        std::set<int> down, pressed, released;
        std::set<int> nextDown, nextUp, afterNextUp;

        void PressNext(int c)   { nextDown.insert(c); }
        void ReleaseNext(int c) { nextUp.insert(c); }
        void Tap(int c)         { nextDown.insert(c); afterNextUp.insert(c); }
        void Advance();
    };

    ButtonSet m_keys;
    ButtonSet m_buttons;
    Vector2   m_mouse      = { 0, 0 };
    Vector2   m_nextMouse  = { 0, 0 };
    Vector2   m_mouseDelta = { 0, 0 };
    float     m_wheel      = 0.0f;
    float     m_nextWheel  = 0.0f;
};

} // namespace Kindling::Input
