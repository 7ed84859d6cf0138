#pragma once

// ── Kindling::GFX procedural models ─────────────────────────────────────────
//
// CPU-side generators for the primitive shapes the composition helpers use.
// All meshes are centred on the origin. Axis-aligned solids of revolution
// (sphere, cylinder, cone, capsule, torus, teapot) use +Y as their axis.
//
// Size conventions (size.x / size.y / size.z):
//   Plane          width / depth / -
//   InfinitePlane  ignored (drawn as a large plane)
//   Sphere         radius / - / -
//   Cube           x / y / z extents
//   Cylinder, Cone radius / height / -
//   Capsule        radius / length of the straight section / -
//   Torus          major radius / minor radius / -
//   Teapot         overall scale / - / -
//   TriangularPrism  width / height / depth
//
// 2D shapes are extruded along Z by `depth`:
//   Square, Rectangle  x / y extents
//   Circle             radius (cylinder along +Y, callers rotate it to face Z)
//   Triangle           width / height (isosceles, apex up)
//   Polygon            radius of a regular pentagon
//   Capsule            total width / height of a stadium outline

#include <GFX/MeshData.hpp>
#include <raylib.h>
#include <optional>
#include <string>

namespace Kindling::GFX {

enum class PrimitiveModelType {
    Plane,
    InfinitePlane,
    Sphere,
    Cube,
    Cylinder,
    Torus,
    Teapot,
    Cone,
    Capsule,
    TriangularPrism,
};

enum class Primitive2DModelType {
    Square,
    Rectangle,
    Circle,
    Triangle,
    Polygon,
    Capsule,
};

const char* ToString(PrimitiveModelType type);
const char* ToString(Primitive2DModelType type);

// Inverse of ToString, case-insensitive. nullopt for an unknown name.
std::optional<PrimitiveModelType>   ParsePrimitiveModelType(const std::string& name);
std::optional<Primitive2DModelType> ParsePrimitive2DModelType(const std::string& name);

// Default size used when a caller passes no size.
Vector3 DefaultSize(PrimitiveModelType type);
Vector2 DefaultSize(Primitive2DModelType type);

inline constexpr float DefaultShapeDepth = 0.04f;

class Procedural3DModelBuilder {
public:
    static MeshData Build(PrimitiveModelType type, std::optional<Vector3> size = std::nullopt);
};

class Procedural2DModelBuilder {
public:
    static MeshData Build(Primitive2DModelType type, std::optional<Vector2> size = std::nullopt,
                          float depth = DefaultShapeDepth);
};

// Individual generators
MeshData GeneratePlane(float width, float depth);
MeshData GenerateCube(Vector3 size);
MeshData GenerateSphere(float radius, int tessellation = 16);
MeshData GenerateCylinder(float radius, float height, int tessellation = 32);
MeshData GenerateCone(float radius, float height, int tessellation = 32);
MeshData GenerateCapsule(float radius, float length, int tessellation = 16);
MeshData GenerateTorus(float majorRadius, float minorRadius, int tessellation = 32);
MeshData GenerateTeapot(float size, int tessellation = 24);
MeshData GenerateTriangularPrism(Vector3 size);

} // namespace Kindling::GFX
