#pragma once

#include <raylib.h>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Kindling {
class Game;
class Scene;
class BackgroundComponent;
}

namespace Kindling::GFX {

// Draws a Game's root scene through raylib:
// background → models / gizmos / colliders / script 3D → UI → overlays → debug text.
class Renderer {
public:
    Renderer() = default;
    ~Renderer();

    Renderer(const Renderer&)            = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Whole frame, BeginDrawing() to EndDrawing(). Needs an open window.
    void DrawFrame(Game& game);

    // Release textures and every uploaded model. Call before the window closes.
    void Unload();

    bool showColliders = false;

    // Key light used when the scene has no directional light.
    Vector3 fallbackLightDir = { -0.3f, -1.0f, -0.5f };

    // Clear background with RGBA components (0-255)
    static void ClearScreen(int r, int g, int b, int a = 255);

    // Draw text using the default font
    static void DrawText(const std::string& text, int x, int y, int fontSize, Color color);

private:
    void DrawBackground(const BackgroundComponent& bg, int width, int height);
    void DrawColliders(const Scene& scene);
    const Texture2D* Texture(const std::string& path);

    std::unordered_map<std::string, Texture2D> m_textures;
    std::unordered_set<std::string>            m_missing;
};

} // namespace Kindling::GFX
