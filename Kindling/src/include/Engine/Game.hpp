#pragma once

#include <Core/Settings.hpp>
#include <Engine/GraphicsCompositor.hpp>
#include <Engine/Scene.hpp>
#include <Engine/Scheduler.hpp>
#include <GFX/DebugText.hpp>
#include <GFX/Renderer.hpp>
#include <Input/InputSource.hpp>
#include <Physics/Simulation.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Kindling {

struct GameTime {
    double   total           = 0.0;   // seconds since the first frame
    float    elapsed         = 0.0f;  // seconds since the previous frame
    double   elapsedAccurate = 0.0;   // same, at full precision
    uint64_t frameCount      = 0;
    float    framesPerSecond = 0.0f;  // refreshed once per second

    void Advance(double dt);

private:
    float m_fpsWindow = 0.0f;
    int   m_fpsFrames = 0;
};

// Timing of one piece of work during the last frame.
struct ProfilingSample {
    std::string name;
    std::string category;   // "Update", "Physics" or "Draw"
    double      ms = 0.0;
};

// Owns the root scene and every per-frame system, and drives the loop:
// input → scheduled tasks → scripts → UI → physics → draw.
//
// In headless mode no window is opened, every frame advances by the fixed
// time step and nothing is drawn.
class Game {
public:
    explicit Game(GameSettings settings = {});
    ~Game();

    Game(const Game&)            = delete;
    Game& operator=(const Game&) = delete;

    const GameSettings& GetSettings() const { return m_settings; }

    Scene&               GetRootScene()  { return m_rootScene; }
    FrameScheduler&      GetScheduler()  { return m_scheduler; }
    Physics::Simulation& GetSimulation() { return m_simulation; }
    GFX::DebugTextSystem& GetDebugText() { return m_debugText; }
    GFX::Renderer&       GetRenderer()   { return m_renderer; }
    const GameTime&      GetTime() const { return m_time; }

    Input::InputSource& GetInput() { return *m_input; }
    void SetInput(std::unique_ptr<Input::InputSource> input);

    const std::shared_ptr<GraphicsCompositor>& GetCompositor() const { return m_compositor; }
    void SetCompositor(std::shared_ptr<GraphicsCompositor> compositor) { m_compositor = std::move(compositor); }

    bool IsHeadless() const { return m_settings.headless; }
    bool IsRunning() const  { return m_running; }

    void               SetWindowTitle(const std::string& title);
    const std::string& GetWindowTitle() const { return m_settings.title; }
    void               SetResizable(bool resizable);

    // 0 = uncapped.
    void SetTargetFPS(int fps);
    int  GetTargetFPS() const { return m_settings.targetFPS; }

    int ScreenWidth() const;
    int ScreenHeight() const;

    // Open the window (unless headless) and loop until Exit(), the window is
    // closed or the frame limit is hit.
    void Run();

    // One frame. Returns false once the loop should stop.
    bool Tick();

    // Stop after the current frame and cancel every scheduled task.
    void Exit();

    const std::vector<ProfilingSample>& GetLastFrameSamples() const { return m_samples; }

private:
    void RunScripts();
    void UpdateUI();
    void Shutdown();

    GameSettings                        m_settings;
    Scene                               m_rootScene;
    FrameScheduler                      m_scheduler;
    Physics::Simulation                 m_simulation;
    GFX::DebugTextSystem                m_debugText;
    GFX::Renderer                       m_renderer;
    GameTime                            m_time;
    std::unique_ptr<Input::InputSource> m_input;
    std::shared_ptr<GraphicsCompositor> m_compositor;
    std::vector<ProfilingSample>        m_samples;

    double m_lastFrameStart = 0.0;   // raylib GetTime() at the previous tick

    bool m_running       = false;
    bool m_windowOpen    = false;
    bool m_exitRequested = false;
};

} // namespace Kindling
