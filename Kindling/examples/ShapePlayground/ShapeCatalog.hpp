#pragma once

#include <GFX/ProceduralModels.hpp>
#include <GFX/RenderModel.hpp>
#include <raylib.h>
#include <memory>
#include <optional>
#include <vector>

namespace ShapePlayground {

// One spawnable 2D shape. `model` is filled by the first spawn and shared by
// every later one.
struct Shape2DModel {
    Kindling::GFX::Primitive2DModelType         type;
    Color                                       color;
    Vector2                                     size;
    std::shared_ptr<Kindling::GFX::RenderModel> model;
};

class ShapeCatalog {
public:
    ShapeCatalog() = default;
    explicit ShapeCatalog(std::vector<Shape2DModel> shapes) : m_shapes(std::move(shapes)) {}

    // Green square, orange rectangle, red circle, purple triangle.
    static ShapeCatalog Default();

    // The entry for `type`, or a random one when no type is given.
    // nullptr when the catalog has no such shape.
    Shape2DModel* Find(std::optional<Kindling::GFX::Primitive2DModelType> type = std::nullopt);

    std::vector<Shape2DModel>&       Shapes()       { return m_shapes; }
    const std::vector<Shape2DModel>& Shapes() const { return m_shapes; }

private:
    std::vector<Shape2DModel> m_shapes;
};

} // namespace ShapePlayground
