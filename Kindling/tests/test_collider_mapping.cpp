// Primitive type -> collider shape tables

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <Core/Error.hpp>
#include <GFX/ProceduralModels.hpp>
#include <Physics/ColliderMapping.hpp>

using namespace Kindling;
using namespace Kindling::Physics;
using GFX::Primitive2DModelType;
using GFX::PrimitiveModelType;
using Catch::Matchers::WithinAbs;

// =============================================================================
// 3D mapping
// =============================================================================

TEST_CASE("3D mapping copies the requested size", "[physics][mapping]") {
    SECTION("plane becomes a flat box") {
        auto shape = Get3DColliderShape(PrimitiveModelType::Plane, Vector3{ 15, 10, 0 });
        REQUIRE(shape);
        const auto* box = shape->As<BoxShape>();
        REQUIRE(box != nullptr);
        REQUIRE_THAT(box->size.x, WithinAbs(15.0f, 1e-6f));
        REQUIRE_THAT(box->size.y, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(box->size.z, WithinAbs(10.0f, 1e-6f));
    }

    SECTION("infinite plane is a static plane facing up") {
        auto shape = Get3DColliderShape(PrimitiveModelType::InfinitePlane);
        REQUIRE(shape);
        const auto* plane = shape->As<StaticPlaneShape>();
        REQUIRE(plane != nullptr);
        REQUIRE_THAT(plane->normal.y, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(plane->offset, WithinAbs(0.0f, 1e-6f));
    }

    SECTION("sphere radius is size.x") {
        auto shape = Get3DColliderShape(PrimitiveModelType::Sphere, Vector3{ 2.5f, 9, 9 });
        REQUIRE(shape);
        REQUIRE_THAT(shape->As<SphereShape>()->radius, WithinAbs(2.5f, 1e-6f));
    }

    SECTION("cube keeps all three extents") {
        auto shape = Get3DColliderShape(PrimitiveModelType::Cube, Vector3{ 1, 2, 3 });
        REQUIRE(shape);
        const auto* box = shape->As<BoxShape>();
        REQUIRE(box != nullptr);
        REQUIRE(box->size.x == 1.0f);
        REQUIRE(box->size.y == 2.0f);
        REQUIRE(box->size.z == 3.0f);
        REQUIRE_FALSE(box->is2D);
    }

    SECTION("cylinder and cone read radius and height") {
        auto cyl = Get3DColliderShape(PrimitiveModelType::Cylinder, Vector3{ 0.7f, 3, 0 });
        REQUIRE(cyl);
        REQUIRE_THAT(cyl->As<CylinderShape>()->radius, WithinAbs(0.7f, 1e-6f));
        REQUIRE_THAT(cyl->As<CylinderShape>()->height, WithinAbs(3.0f, 1e-6f));

        auto cone = Get3DColliderShape(PrimitiveModelType::Cone, Vector3{ 0.4f, 2, 0 });
        REQUIRE(cone);
        REQUIRE_THAT(cone->As<ConeShape>()->radius, WithinAbs(0.4f, 1e-6f));
        REQUIRE_THAT(cone->As<ConeShape>()->height, WithinAbs(2.0f, 1e-6f));
    }

    SECTION("capsule reads radius and length") {
        auto shape = Get3DColliderShape(PrimitiveModelType::Capsule, Vector3{ 0.2f, 1.5f, 0 });
        REQUIRE(shape);
        REQUIRE_THAT(shape->As<CapsuleShape>()->radius, WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(shape->As<CapsuleShape>()->length, WithinAbs(1.5f, 1e-6f));
    }

    SECTION("is2D is carried through") {
        auto shape = Get3DColliderShape(PrimitiveModelType::Cube, Vector3{ 1, 1, 1 }, true);
        REQUIRE(shape);
        REQUIRE(shape->Is2D());
    }
}

TEST_CASE("3D mapping defaults", "[physics][mapping]") {
    auto box = Get3DColliderShape(PrimitiveModelType::Cube);
    REQUIRE(box);
    REQUIRE(box->As<BoxShape>()->size.x == 1.0f);

    auto sphere = Get3DColliderShape(PrimitiveModelType::Sphere);
    REQUIRE(sphere);
    REQUIRE_THAT(sphere->As<SphereShape>()->radius, WithinAbs(0.5f, 1e-6f));

    auto capsule = Get3DColliderShape(PrimitiveModelType::Capsule);
    REQUIRE(capsule);
    REQUIRE_THAT(capsule->As<CapsuleShape>()->radius, WithinAbs(DefaultCapsuleRadius, 1e-6f));
    REQUIRE_THAT(capsule->As<CapsuleShape>()->length, WithinAbs(0.5f, 1e-6f));

    auto cylinder = Get3DColliderShape(PrimitiveModelType::Cylinder);
    REQUIRE(cylinder);
    REQUIRE_THAT(cylinder->As<CylinderShape>()->height, WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("Shapes without a physical form map to nothing", "[physics][mapping]") {
    REQUIRE_NOTHROW(Get3DColliderShape(PrimitiveModelType::Torus));
    REQUIRE_FALSE(Get3DColliderShape(PrimitiveModelType::Torus).has_value());
    REQUIRE_FALSE(Get3DColliderShape(PrimitiveModelType::Teapot, Vector3{ 2, 2, 2 }).has_value());
}

TEST_CASE("3D mapping rejects types it has no entry for", "[physics][mapping]") {
    REQUIRE_THROWS_AS(Get3DColliderShape(PrimitiveModelType::TriangularPrism), InvalidOperationError);
}

// =============================================================================
// 2D mapping
// =============================================================================

TEST_CASE("2D mapping", "[physics][mapping]") {
    SECTION("square and rectangle become flat 2D boxes") {
        auto square = Get2DColliderShape(Primitive2DModelType::Square, Vector2{ 0.2f, 0.2f }, 0.04f);
        const auto* box = square.As<BoxShape>();
        REQUIRE(box != nullptr);
        REQUIRE(box->is2D);
        REQUIRE_THAT(box->size.x, WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(box->size.y, WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(box->size.z, WithinAbs(0.0f, 1e-6f));

        auto rect = Get2DColliderShape(Primitive2DModelType::Rectangle, Vector2{ 0.2f, 0.3f });
        REQUIRE_THAT(rect.As<BoxShape>()->size.y, WithinAbs(0.3f, 1e-6f));
    }

    SECTION("circle becomes a 2D sphere") {
        auto circle = Get2DColliderShape(Primitive2DModelType::Circle, Vector2{ 0.1f, 0.1f });
        const auto* sphere = circle.As<SphereShape>();
        REQUIRE(sphere != nullptr);
        REQUIRE(sphere->is2D);
        REQUIRE_THAT(sphere->radius, WithinAbs(0.1f, 1e-6f));
    }

    SECTION("other shapes throw") {
        REQUIRE_THROWS_AS(Get2DColliderShape(Primitive2DModelType::Triangle), InvalidOperationError);
        REQUIRE_THROWS_AS(Get2DColliderShape(Primitive2DModelType::Polygon), InvalidOperationError);
        REQUIRE_THROWS_AS(Get2DColliderShape(Primitive2DModelType::Capsule), InvalidOperationError);
    }
}

TEST_CASE("Compound mapping", "[physics][mapping]") {
    SECTION("2D square gets the extrusion depth") {
        auto square = Get2DColliderShapeCompound(Primitive2DModelType::Square, Vector2{ 0.2f, 0.2f }, 0.04f);
        const auto* box = square.As<BoxShape>();
        REQUIRE(box != nullptr);
        REQUIRE_THAT(box->size.x, WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(box->size.y, WithinAbs(0.2f, 1e-6f));
        REQUIRE_THAT(box->size.z, WithinAbs(0.04f, 1e-6f));
    }

    SECTION("2D circle") {
        auto circle = Get2DColliderShapeCompound(Primitive2DModelType::Circle, Vector2{ 0.3f, 0.3f }, 0.04f);
        REQUIRE_THAT(circle.As<SphereShape>()->radius, WithinAbs(0.3f, 1e-6f));
    }

    SECTION("3D plane and cube") {
        auto plane = Get3DColliderShapeCompound(PrimitiveModelType::Plane, Vector3{ 4, 6, 0 });
        REQUIRE_THAT(plane.As<BoxShape>()->size.z, WithinAbs(6.0f, 1e-6f));
        REQUIRE_THAT(plane.As<BoxShape>()->size.y, WithinAbs(0.0f, 1e-6f));

        auto cube = Get3DColliderShapeCompound(PrimitiveModelType::Cube, Vector3{ 2, 3, 4 });
        REQUIRE(cube.As<BoxShape>()->size.z == 4.0f);
    }

    SECTION("unsupported types throw") {
        REQUIRE_THROWS_AS(Get3DColliderShapeCompound(PrimitiveModelType::Sphere), InvalidOperationError);
        REQUIRE_THROWS_AS(Get2DColliderShapeCompound(Primitive2DModelType::Triangle), InvalidOperationError);
    }
}

TEST_CASE("Triangle hull mirrors the generated prism", "[physics][mapping]") {
    const Vector2 size  = { 0.2f, 0.2f };
    const float   depth = 0.04f;

    auto hull = CreateTriangleHull(size, depth);
    const auto* shape = hull.As<ConvexHullShape>();
    REQUIRE(shape != nullptr);

    GFX::MeshData mesh = GFX::GenerateTriangularPrism({ size.x, size.y, depth });
    REQUIRE(shape->hulls.size() == 1);
    REQUIRE(shape->PointCount() == (std::size_t)mesh.VertexCount());
    REQUIRE(shape->hullIndices[0].size() == mesh.indices.size());
    REQUIRE_THAT(shape->scaling.x, WithinAbs(0.9f, 1e-6f));
    REQUIRE_THAT(shape->scaling.z, WithinAbs(0.9f, 1e-6f));
}
