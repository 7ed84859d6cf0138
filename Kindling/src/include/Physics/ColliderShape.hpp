#pragma once

// ── Kindling::Physics collider shapes ───────────────────────────────────────
//
// Plain descriptions of collision volumes. They carry no simulation state;
// a PhysicsComponent owns a list of them and the Simulation reads it.
//
//   ColliderShapeDesc box = ColliderShapeDesc::Box({ 1, 2, 1 });
//   if (auto* b = box.As<BoxShape>()) { ... }

#include <raylib.h>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace Kindling::Physics {

// Z extent used for a 2D box, which is otherwise flat.
inline constexpr float Box2DThickness = 0.001f;

struct BoxShape {
    Vector3 size = { 1, 1, 1 };
    bool    is2D = false;

    // Extents the simulation collides with: a 2D box gets a thin Z slab.
    Vector3 EffectiveSize() const;
};

struct SphereShape {
    float radius = 0.5f;
    bool  is2D   = false;
};

struct CapsuleShape {
    float radius = 0.5f;
    float length = 0.5f;   // straight section between the two caps
    bool  is2D   = false;
};

struct CylinderShape {
    float radius = 0.5f;
    float height = 1.0f;
};

struct ConeShape {
    float radius = 0.5f;
    float height = 1.0f;
};

struct StaticPlaneShape {
    Vector3 normal = { 0, 1, 0 };
    float   offset = 0.0f;
};

// One or more hulls, each given as points plus triangle indices into them.
struct ConvexHullShape {
    std::vector<std::vector<Vector3>>  hulls;
    std::vector<std::vector<uint32_t>> hullIndices;
    Vector3                            scaling = { 1, 1, 1 };

    std::size_t PointCount() const;
};

enum class ColliderShapeType {
    Box,
    Sphere,
    Capsule,
    Cylinder,
    Cone,
    StaticPlane,
    ConvexHull,
};

const char* ToString(ColliderShapeType type);

// Axis-aligned box enclosing `local` after transforming it by `world`.
BoundingBox TransformBounds(const BoundingBox& local, const Matrix& world);

struct ColliderShapeDesc {
    using Shape = std::variant<BoxShape, SphereShape, CapsuleShape, CylinderShape,
                               ConeShape, StaticPlaneShape, ConvexHullShape>;

    Shape      shape;
    Vector3    localOffset   = { 0, 0, 0 };
    Quaternion localRotation = { 0, 0, 0, 1 };

    static ColliderShapeDesc Box(Vector3 size, bool is2D = false);
    static ColliderShapeDesc Sphere(float radius, bool is2D = false);
    static ColliderShapeDesc Capsule(float radius, float length, bool is2D = false);
    static ColliderShapeDesc Cylinder(float radius, float height);
    static ColliderShapeDesc Cone(float radius, float height);
    static ColliderShapeDesc StaticPlane(Vector3 normal = { 0, 1, 0 }, float offset = 0.0f);
    static ColliderShapeDesc ConvexHull(std::vector<Vector3> points, std::vector<uint32_t> indices,
                                        Vector3 scaling = { 1, 1, 1 });

    ColliderShapeType Type() const { return (ColliderShapeType)shape.index(); }
    bool Is2D() const;

    template <class T> const T* As() const { return std::get_if<T>(&shape); }
    template <class T> T*       As()       { return std::get_if<T>(&shape); }

    // Bounds in the owning entity's space (offset and rotation applied,
    // entity scale not). Unbounded for a static plane.
    BoundingBox LocalBounds() const;
    BoundingBox WorldBounds(const Matrix& world) const;

    std::string Describe() const;
};

} // namespace Kindling::Physics
