#include <Engine/Game.hpp>
#include <Engine/Components.hpp>
#include <UI/UI.hpp>
#include <imgui/rlImGui.h>
#include <raylib.h>
#include <chrono>

namespace Kindling {

using Clock = std::chrono::steady_clock;

static double MillisecondsSince(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

void GameTime::Advance(double dt)
{
    elapsedAccurate = dt;
    elapsed         = (float)dt;
    total          += dt;
    ++frameCount;

    m_fpsWindow += elapsed;
    ++m_fpsFrames;
    if (m_fpsWindow >= 1.0f) {
        framesPerSecond = (float)m_fpsFrames / m_fpsWindow;
        m_fpsWindow     = 0.0f;
        m_fpsFrames     = 0;
    }
}

Game::Game(GameSettings settings)
    : m_settings(std::move(settings))
{
    SetTraceLogLevel(m_settings.logLevel);
    m_simulation.Settings().fixedTimeStep = m_settings.fixedTimeStep;

    if (m_settings.headless) m_input = std::make_unique<Input::ScriptedInput>();
    else                     m_input = std::make_unique<Input::RaylibInput>();

    TraceLog(LOG_DEBUG, "[Game] Created '%s' (%dx%d%s)", m_settings.title.c_str(),
             m_settings.width, m_settings.height, m_settings.headless ? ", headless" : "");
}

Game::~Game()
{
    if (m_windowOpen) Shutdown();
}

void Game::SetInput(std::unique_ptr<Input::InputSource> input)
{
    if (!input) return;
    m_input = std::move(input);
}

void Game::SetWindowTitle(const std::string& title)
{
    m_settings.title = title;
    if (m_windowOpen) ::SetWindowTitle(title.c_str());
}

void Game::SetResizable(bool resizable)
{
    m_settings.resizable = resizable;
    if (!m_windowOpen) return;
    if (resizable) SetWindowState(FLAG_WINDOW_RESIZABLE);
    else           ClearWindowState(FLAG_WINDOW_RESIZABLE);
}

void Game::SetTargetFPS(int fps)
{
    m_settings.targetFPS = fps < 0 ? 0 : fps;
    if (m_windowOpen) ::SetTargetFPS(m_settings.targetFPS);
}

int Game::ScreenWidth() const
{
    return m_windowOpen ? GetScreenWidth() : m_settings.width;
}

int Game::ScreenHeight() const
{
    return m_windowOpen ? GetScreenHeight() : m_settings.height;
}

void Game::Run()
{
    if (m_running) {
        TraceLog(LOG_WARNING, "[Game] Run() called while already running");
        return;
    }

    if (!m_settings.headless) {
        if (m_settings.resizable) SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
        else                      SetConfigFlags(FLAG_MSAA_4X_HINT);
        InitWindow(m_settings.width, m_settings.height, m_settings.title.c_str());
        if (!IsWindowReady()) {
            TraceLog(LOG_ERROR, "[Game] Failed to open window");
            return;
        }
        m_windowOpen     = true;
        m_lastFrameStart = GetTime();
        ::SetTargetFPS(m_settings.targetFPS);
        rlImGuiSetup(true);
        TraceLog(LOG_INFO, "[Game] Window open, target FPS %d", m_settings.targetFPS);
    }

    m_running       = true;
    m_exitRequested = false;
    TraceLog(LOG_INFO, "[Game] Entering main loop");
    while (Tick()) {}
    TraceLog(LOG_INFO, "[Game] Main loop finished after %llu frames", (unsigned long long)m_time.frameCount);

    Shutdown();
}

bool Game::Tick()
{
    if (m_exitRequested) return false;
    if (m_windowOpen && WindowShouldClose()) return false;
    if (m_settings.maxFrames > 0 && m_time.frameCount >= (uint64_t)m_settings.maxFrames) return false;

    m_samples.clear();

    double dt = m_settings.fixedTimeStep;
    if (m_windowOpen) {
        double now = GetTime();
        dt = now - m_lastFrameStart;
        m_lastFrameStart = now;
    }
    m_time.Advance(dt);

    m_input->Poll();
    m_debugText.Clear();

    auto t0 = Clock::now();
    m_scheduler.Tick();
    m_samples.push_back({ "Scheduler", "Update", MillisecondsSince(t0) });

    RunScripts();
    UpdateUI();

    t0 = Clock::now();
    m_simulation.Step(m_rootScene, dt);
    m_samples.push_back({ "Simulation", "Physics", MillisecondsSince(t0) });

    if (m_windowOpen) {
        t0 = Clock::now();
        m_renderer.DrawFrame(*this);
        m_samples.push_back({ "Renderer", "Draw", MillisecondsSince(t0) });
    }

    return !m_exitRequested;
}

void Game::Exit()
{
    m_exitRequested = true;
    m_scheduler.CancelAll();
    TraceLog(LOG_DEBUG, "[Game] Exit requested");
}

void Game::RunScripts()
{
    m_rootScene.Visit([this](Entity& e) {
        for (auto* s : e.GetAll<ScriptComponent>()) {
            if (!s->enabled) continue;
            auto t0 = Clock::now();
            if (!s->started) {
                s->started = true;
                s->Start(*this);
            }
            s->Update(*this);
            m_samples.push_back({ e.GetName(), "Update", MillisecondsSince(t0) });
        }
    });
}

void Game::UpdateUI()
{
    if (!m_compositor || !m_compositor->uiStage) return;
    m_rootScene.ForEach<UI::UIComponent>([this](Entity&, UI::UIComponent& ui) {
        if (ui.page) ui.page->Update(*m_input);
    });
}

void Game::Shutdown()
{
    m_running = false;
    m_scheduler.CancelAll();
    if (!m_windowOpen) return;

    m_renderer.Unload();
    rlImGuiShutdown();
    CloseWindow();
    m_windowOpen = false;
    TraceLog(LOG_INFO, "[Game] Window closed");
}

} // namespace Kindling
