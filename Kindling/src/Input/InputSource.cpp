#include <Input/InputSource.hpp>
#include <raymath.h>

namespace Kindling::Input {

void ScriptedInput::ButtonSet::Advance()
{
    pressed.clear();
    released.clear();

    for (int c : nextUp)
        if (down.erase(c)) released.insert(c);
    for (int c : nextDown)
        if (down.insert(c).second) pressed.insert(c);

    nextDown.clear();
    nextUp = std::move(afterNextUp);
    afterNextUp.clear();
}

void ScriptedInput::Click(int b, Vector2 position)
{
    SetMousePosition(position);
    m_buttons.Tap(b);
}

void ScriptedInput::Poll()
{
    m_keys.Advance();
    m_buttons.Advance();

    m_mouseDelta = Vector2Subtract(m_nextMouse, m_mouse);
    m_mouse      = m_nextMouse;
    m_wheel      = m_nextWheel;
    m_nextWheel  = 0.0f;
}

} // namespace Kindling::Input
