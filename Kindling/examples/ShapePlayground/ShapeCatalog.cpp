#include "ShapeCatalog.hpp"

using Kindling::GFX::Primitive2DModelType;

namespace ShapePlayground {

static constexpr Vector2 SquareSize    = { 0.2f, 0.2f };
static constexpr Vector2 RectangleSize = { 0.2f, 0.3f };
static constexpr Vector2 CircleSize    = { 0.1f, 0.1f };

ShapeCatalog ShapeCatalog::Default()
{
    return ShapeCatalog({
        { Primitive2DModelType::Square,    GREEN,  SquareSize,    nullptr },
        { Primitive2DModelType::Rectangle, ORANGE, RectangleSize, nullptr },
        { Primitive2DModelType::Circle,    RED,    CircleSize,    nullptr },
        { Primitive2DModelType::Triangle,  PURPLE, SquareSize,    nullptr },
    });
}

Shape2DModel* ShapeCatalog::Find(std::optional<Primitive2DModelType> type)
{
    if (m_shapes.empty()) return nullptr;
    if (!type) return &m_shapes[GetRandomValue(0, (int)m_shapes.size() - 1)];

    for (auto& s : m_shapes)
        if (s.type == *type) return &s;
    return nullptr;
}

} // namespace ShapePlayground
