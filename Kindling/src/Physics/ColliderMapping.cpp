#include <Physics/ColliderMapping.hpp>
#include <Core/Error.hpp>
#include <string>

namespace Kindling::Physics {

using GFX::Primitive2DModelType;
using GFX::PrimitiveModelType;

static InvalidOperationError Unsupported(const char* table, const char* type)
{
    return InvalidOperationError(std::string("No ") + table + " collider for primitive '" + type + "'");
}

std::optional<ColliderShapeDesc> Get3DColliderShape(PrimitiveModelType type, std::optional<Vector3> size, bool is2D)
{
    switch (type) {
        case PrimitiveModelType::Plane:
            if (!size) return ColliderShapeDesc::Box({ 1, 1, 1 });
            return ColliderShapeDesc::Box({ size->x, 0.0f, size->y });

        case PrimitiveModelType::InfinitePlane:
            return ColliderShapeDesc::StaticPlane();

        case PrimitiveModelType::Sphere:
            if (!size) return ColliderShapeDesc::Sphere(0.5f);
            return ColliderShapeDesc::Sphere(size->x, is2D);

        case PrimitiveModelType::Cube:
            if (!size) return ColliderShapeDesc::Box({ 1, 1, 1 });
            return ColliderShapeDesc::Box(*size, is2D);

        case PrimitiveModelType::Cylinder:
            if (!size) return ColliderShapeDesc::Cylinder(0.5f, 1.0f);
            return ColliderShapeDesc::Cylinder(size->x, size->y);

        case PrimitiveModelType::Cone:
            if (!size) return ColliderShapeDesc::Cone(0.5f, 1.0f);
            return ColliderShapeDesc::Cone(size->x, size->y);

        case PrimitiveModelType::Capsule:
            if (!size) return ColliderShapeDesc::Capsule(DefaultCapsuleRadius, 0.5f);
            return ColliderShapeDesc::Capsule(size->x, size->y, is2D);

        case PrimitiveModelType::Torus:
        case PrimitiveModelType::Teapot:
            return std::nullopt;

        default:
            break;
    }
    throw Unsupported("3D", GFX::ToString(type));
}

ColliderShapeDesc Get2DColliderShape(Primitive2DModelType type, std::optional<Vector2> size, float /*depth*/)
{
    switch (type) {
        case Primitive2DModelType::Rectangle:
        case Primitive2DModelType::Square:
            if (!size) return ColliderShapeDesc::Box({ 1, 1, 1 }, true);
            return ColliderShapeDesc::Box({ size->x, size->y, 0.0f }, true);

        case Primitive2DModelType::Circle:
            if (!size) return ColliderShapeDesc::Sphere(0.5f);
            return ColliderShapeDesc::Sphere(size->x, true);

        default:
            break;
    }
    throw Unsupported("2D", GFX::ToString(type));
}

ColliderShapeDesc Get3DColliderShapeCompound(PrimitiveModelType type, std::optional<Vector3> size)
{
    switch (type) {
        case PrimitiveModelType::Plane:
            if (!size) return ColliderShapeDesc::Box({ 1, 1, 1 });
            return ColliderShapeDesc::Box({ size->x, 0.0f, size->y });

        case PrimitiveModelType::Cube:
            return ColliderShapeDesc::Box(size.value_or(Vector3{ 1, 1, 1 }));

        default:
            break;
    }
    throw Unsupported("compound 3D", GFX::ToString(type));
}

ColliderShapeDesc Get2DColliderShapeCompound(Primitive2DModelType type, std::optional<Vector2> size, float depth)
{
    switch (type) {
        case Primitive2DModelType::Rectangle:
        case Primitive2DModelType::Square:
            if (!size) return ColliderShapeDesc::Box({ 1, 1, 1 });
            return ColliderShapeDesc::Box({ size->x, size->y, depth });

        case Primitive2DModelType::Circle:
            if (!size) return ColliderShapeDesc::Sphere(0.5f);
            return ColliderShapeDesc::Sphere(size->x);

        default:
            break;
    }
    throw Unsupported("compound 2D", GFX::ToString(type));
}

ColliderShapeDesc CreateTriangleHull(std::optional<Vector2> size, float depth)
{
    Vector2 s = size.value_or(Vector2{ 1, 1 });
    GFX::MeshData mesh = GFX::GenerateTriangularPrism({ s.x, s.y, depth });

    std::vector<uint32_t> indices(mesh.indices.begin(), mesh.indices.end());
    return ColliderShapeDesc::ConvexHull(mesh.Positions(), std::move(indices), { 0.9f, 0.9f, 0.9f });
}

} // namespace Kindling::Physics
