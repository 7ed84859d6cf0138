#pragma once

// ── Kindling::Physics collider mapping ──────────────────────────────────────
//
// Maps a procedural primitive type (plus optional size) to the collider that
// matches it. Absent size means "use the shape's default".
//
//   Get3DColliderShape        regular physics components
//   Get2DColliderShape        regular physics components, 2D shapes
//   Get3DColliderShapeCompound  compound colliders (CollidableComponent)
//   Get2DColliderShapeCompound  compound colliders, 2D shapes
//
// Primitives with no physical representation (torus, teapot) map to
// std::nullopt. Types a table does not know throw InvalidOperationError.

#include <GFX/ProceduralModels.hpp>
#include <Physics/ColliderShape.hpp>
#include <raylib.h>
#include <optional>

namespace Kindling::Physics {

inline constexpr float DefaultCapsuleRadius = 0.35f;

std::optional<ColliderShapeDesc> Get3DColliderShape(GFX::PrimitiveModelType type,
                                                    std::optional<Vector3> size = std::nullopt,
                                                    bool is2D = false);

// Flat shapes: boxes always have z = 0 and `depth` does not change the
// result. It is accepted so 2D options pass straight through.
ColliderShapeDesc Get2DColliderShape(GFX::Primitive2DModelType type,
                                     std::optional<Vector2> size = std::nullopt,
                                     float depth = 0.0f);

ColliderShapeDesc Get3DColliderShapeCompound(GFX::PrimitiveModelType type,
                                             std::optional<Vector3> size = std::nullopt);

ColliderShapeDesc Get2DColliderShapeCompound(GFX::Primitive2DModelType type,
                                             std::optional<Vector2> size = std::nullopt,
                                             float depth = 0.0f);

// Convex hull wrapping the generated triangular prism, shrunk slightly
// (scaling 0.9) so neighbouring triangles do not snag on each other.
ColliderShapeDesc CreateTriangleHull(std::optional<Vector2> size, float depth);

} // namespace Kindling::Physics
