#pragma once

#include "ShapeCatalog.hpp"
#include <Engine/Game.hpp>
#include <GFX/RenderModel.hpp>
#include <memory>
#include <optional>

namespace ShapePlayground {

inline constexpr const char* CubeEntityName  = "Cube";
inline constexpr const char* ShapeEntityName = "Shape";
inline constexpr int         SpawnBatch      = 10;

// Keyboard-driven 2D physics sandbox.
//
//   Space (held)  drop 10 cubes
//   M / R / C / T 10 squares / rectangles / circles / triangles
//   P             10 random shapes
//   X (released)  delete every cube and shape
class Playground {
public:
    explicit Playground(Kindling::Game& game, ShapeCatalog catalog = ShapeCatalog::Default());

    void Start(Kindling::Scene& scene);
    void Update(Kindling::Scene& scene, const Kindling::GameTime& time);

    void GenerateCubes(Kindling::Scene& scene, int count = SpawnBatch);
    void Add2DShapes(Kindling::Scene& scene, std::optional<Kindling::GFX::Primitive2DModelType> type,
                     int count = SpawnBatch);
    void DeleteAll(Kindling::Scene& scene);

    int CubeCount() const { return m_cubes; }

    ShapeCatalog& Catalog() { return m_catalog; }

private:
    Kindling::Entity* SpawnShape(Kindling::Scene& scene, Shape2DModel& shape);
    void RefreshCubeCount(const Kindling::Scene& scene);
    void RenderNavigation();

    Kindling::Game&                             m_game;
    ShapeCatalog                                m_catalog;
    std::shared_ptr<Kindling::GFX::RenderModel> m_cubeModel;
    int                                         m_cubes = 0;
};

} // namespace ShapePlayground
