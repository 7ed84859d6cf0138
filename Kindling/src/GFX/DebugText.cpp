#include <GFX/DebugText.hpp>

namespace Kindling::GFX {

void DebugTextSystem::Print(std::string text, int x, int y, Color color)
{
    m_entries.push_back({ std::move(text), x, y, color });
}

void DebugTextSystem::Draw() const
{
    if (!visible) return;
    for (const auto& e : m_entries) {
        DrawText(e.text.c_str(), e.x + 1, e.y + 1, fontSize, { 0, 0, 0, 160 });
        DrawText(e.text.c_str(), e.x, e.y, fontSize, e.color);
    }
}

} // namespace Kindling::GFX
