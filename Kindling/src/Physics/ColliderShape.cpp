#include <Physics/ColliderShape.hpp>
#include <raymath.h>
#include <cfloat>
#include <cmath>
#include <cstdio>

namespace Kindling::Physics {

Vector3 BoxShape::EffectiveSize() const
{
    return is2D ? Vector3{ size.x, size.y, Box2DThickness } : size;
}

std::size_t ConvexHullShape::PointCount() const
{
    std::size_t n = 0;
    for (const auto& h : hulls) n += h.size();
    return n;
}

const char* ToString(ColliderShapeType type)
{
    switch (type) {
        case ColliderShapeType::Box:         return "Box";
        case ColliderShapeType::Sphere:      return "Sphere";
        case ColliderShapeType::Capsule:     return "Capsule";
        case ColliderShapeType::Cylinder:    return "Cylinder";
        case ColliderShapeType::Cone:        return "Cone";
        case ColliderShapeType::StaticPlane: return "StaticPlane";
        case ColliderShapeType::ConvexHull:  return "ConvexHull";
    }
    return "Unknown";
}

ColliderShapeDesc ColliderShapeDesc::Box(Vector3 size, bool is2D)
{
    return { BoxShape{ size, is2D } };
}

ColliderShapeDesc ColliderShapeDesc::Sphere(float radius, bool is2D)
{
    return { SphereShape{ radius, is2D } };
}

ColliderShapeDesc ColliderShapeDesc::Capsule(float radius, float length, bool is2D)
{
    return { CapsuleShape{ radius, length, is2D } };
}

ColliderShapeDesc ColliderShapeDesc::Cylinder(float radius, float height)
{
    return { CylinderShape{ radius, height } };
}

ColliderShapeDesc ColliderShapeDesc::Cone(float radius, float height)
{
    return { ConeShape{ radius, height } };
}

ColliderShapeDesc ColliderShapeDesc::StaticPlane(Vector3 normal, float offset)
{
    return { StaticPlaneShape{ normal, offset } };
}

ColliderShapeDesc ColliderShapeDesc::ConvexHull(std::vector<Vector3> points, std::vector<uint32_t> indices,
                                                Vector3 scaling)
{
    ConvexHullShape hull;
    hull.hulls.push_back(std::move(points));
    hull.hullIndices.push_back(std::move(indices));
    hull.scaling = scaling;
    return { std::move(hull) };
}

bool ColliderShapeDesc::Is2D() const
{
    if (auto* b = As<BoxShape>())     return b->is2D;
    if (auto* s = As<SphereShape>())  return s->is2D;
    if (auto* c = As<CapsuleShape>()) return c->is2D;
    return false;
}

// Half extents of the shape around its own centre, before local rotation.
static Vector3 HalfExtents(const ColliderShapeDesc::Shape& shape)
{
    struct Visitor {
        Vector3 operator()(const BoxShape& b) const { return Vector3Scale(b.EffectiveSize(), 0.5f); }
        Vector3 operator()(const SphereShape& s) const
        {
            return { s.radius, s.radius, s.is2D ? Box2DThickness * 0.5f : s.radius };
        }
        Vector3 operator()(const CapsuleShape& c) const
        {
            return { c.radius, c.radius + c.length * 0.5f, c.is2D ? Box2DThickness * 0.5f : c.radius };
        }
        Vector3 operator()(const CylinderShape& c) const { return { c.radius, c.height * 0.5f, c.radius }; }
        Vector3 operator()(const ConeShape& c) const { return { c.radius, c.height * 0.5f, c.radius }; }
        Vector3 operator()(const StaticPlaneShape&) const { return { FLT_MAX, FLT_MAX, FLT_MAX }; }
        Vector3 operator()(const ConvexHullShape& h) const
        {
            Vector3 m = { 0, 0, 0 };
            for (const auto& pts : h.hulls)
                for (const auto& p : pts) {
                    Vector3 s = Vector3Multiply(p, h.scaling);
                    m = Vector3Max(m, { fabsf(s.x), fabsf(s.y), fabsf(s.z) });
                }
            return m;
        }
    };
    return std::visit(Visitor{}, shape);
}

BoundingBox ColliderShapeDesc::LocalBounds() const
{
    if (As<StaticPlaneShape>()) return { { -FLT_MAX, -FLT_MAX, -FLT_MAX }, { FLT_MAX, FLT_MAX, FLT_MAX } };

    Vector3 h = HalfExtents(shape);
    Matrix  r = QuaternionToMatrix(localRotation);
    // Extents of a rotated box: |R| * h
    Vector3 e = {
        fabsf(r.m0) * h.x + fabsf(r.m4) * h.y + fabsf(r.m8)  * h.z,
        fabsf(r.m1) * h.x + fabsf(r.m5) * h.y + fabsf(r.m9)  * h.z,
        fabsf(r.m2) * h.x + fabsf(r.m6) * h.y + fabsf(r.m10) * h.z,
    };
    return { Vector3Subtract(localOffset, e), Vector3Add(localOffset, e) };
}

BoundingBox ColliderShapeDesc::WorldBounds(const Matrix& world) const
{
    if (As<StaticPlaneShape>()) return LocalBounds();
    return TransformBounds(LocalBounds(), world);
}

BoundingBox TransformBounds(const BoundingBox& local, const Matrix& world)
{
    Vector3 c  = Vector3Scale(Vector3Add(local.min, local.max), 0.5f);
    Vector3 h  = Vector3Scale(Vector3Subtract(local.max, local.min), 0.5f);
    Vector3 wc = Vector3Transform(c, world);
    Vector3 we = {
        fabsf(world.m0) * h.x + fabsf(world.m4) * h.y + fabsf(world.m8)  * h.z,
        fabsf(world.m1) * h.x + fabsf(world.m5) * h.y + fabsf(world.m9)  * h.z,
        fabsf(world.m2) * h.x + fabsf(world.m6) * h.y + fabsf(world.m10) * h.z,
    };
    return { Vector3Subtract(wc, we), Vector3Add(wc, we) };
}

std::string ColliderShapeDesc::Describe() const
{
    char buf[128];
    struct Visitor {
        char* buf;
        void operator()(const BoxShape& b) const
        {
            snprintf(buf, 128, "Box(%.3f, %.3f, %.3f%s)", b.size.x, b.size.y, b.size.z, b.is2D ? ", 2D" : "");
        }
        void operator()(const SphereShape& s) const
        {
            snprintf(buf, 128, "Sphere(r=%.3f%s)", s.radius, s.is2D ? ", 2D" : "");
        }
        void operator()(const CapsuleShape& c) const
        {
            snprintf(buf, 128, "Capsule(r=%.3f, l=%.3f%s)", c.radius, c.length, c.is2D ? ", 2D" : "");
        }
        void operator()(const CylinderShape& c) const { snprintf(buf, 128, "Cylinder(r=%.3f, h=%.3f)", c.radius, c.height); }
        void operator()(const ConeShape& c) const { snprintf(buf, 128, "Cone(r=%.3f, h=%.3f)", c.radius, c.height); }
        void operator()(const StaticPlaneShape& p) const
        {
            snprintf(buf, 128, "StaticPlane(n=%.2f,%.2f,%.2f d=%.3f)", p.normal.x, p.normal.y, p.normal.z, p.offset);
        }
        void operator()(const ConvexHullShape& h) const
        {
            snprintf(buf, 128, "ConvexHull(%zu points)", h.PointCount());
        }
    };
    std::visit(Visitor{ buf }, shape);
    return buf;
}

} // namespace Kindling::Physics
