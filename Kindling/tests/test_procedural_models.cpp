// Procedural mesh builders

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <GFX/Material.hpp>
#include <GFX/ProceduralModels.hpp>
#include <GFX/RenderModel.hpp>

using namespace Kindling::GFX;
using Catch::Matchers::WithinAbs;

TEST_CASE("Cube mesh", "[gfx][procedural]") {
    MeshData cube = GenerateCube({ 2, 4, 6 });

    SECTION("one quad per face") {
        REQUIRE(cube.VertexCount() == 24);
        REQUIRE(cube.TriangleCount() == 12);
    }

    SECTION("centred on the origin") {
        BoundingBox b = cube.Bounds();
        REQUIRE_THAT(b.min.x, WithinAbs(-1.0f, 1e-5f));
        REQUIRE_THAT(b.max.y, WithinAbs(2.0f, 1e-5f));
        REQUIRE_THAT(b.max.z, WithinAbs(3.0f, 1e-5f));
    }
}

TEST_CASE("Triangular prism", "[gfx][procedural]") {
    MeshData prism = GenerateTriangularPrism({ 1, 1, 0.5f });

    REQUIRE(prism.VertexCount() == 18);
    REQUIRE(prism.TriangleCount() == 8);

    BoundingBox b = prism.Bounds();
    REQUIRE_THAT(b.min.z, WithinAbs(-0.25f, 1e-5f));
    REQUIRE_THAT(b.max.z, WithinAbs(0.25f, 1e-5f));
    REQUIRE_THAT(b.max.y, WithinAbs(0.5f, 1e-5f));
}

TEST_CASE("2D builder extrudes along Z", "[gfx][procedural]") {
    SECTION("square") {
        MeshData m = Procedural2DModelBuilder::Build(Primitive2DModelType::Square, Vector2{ 0.2f, 0.2f }, 0.04f);
        BoundingBox b = m.Bounds();
        REQUIRE_THAT(b.max.x - b.min.x, WithinAbs(0.2f, 1e-5f));
        REQUIRE_THAT(b.max.z - b.min.z, WithinAbs(0.04f, 1e-5f));
    }

    SECTION("circle is a cylinder along +Y") {
        MeshData m = Procedural2DModelBuilder::Build(Primitive2DModelType::Circle, Vector2{ 0.5f, 0.5f }, 0.1f);
        BoundingBox b = m.Bounds();
        REQUIRE_THAT(b.max.y - b.min.y, WithinAbs(0.1f, 1e-4f));
        REQUIRE_THAT(b.max.x, WithinAbs(0.5f, 1e-3f));
    }

    SECTION("every 2D type produces geometry") {
        for (auto type : { Primitive2DModelType::Square, Primitive2DModelType::Rectangle,
                           Primitive2DModelType::Circle, Primitive2DModelType::Triangle,
                           Primitive2DModelType::Polygon, Primitive2DModelType::Capsule }) {
            INFO(ToString(type));
            REQUIRE_FALSE(Procedural2DModelBuilder::Build(type).Empty());
        }
    }
}

TEST_CASE("3D builder uses default sizes", "[gfx][procedural]") {
    MeshData cube = Procedural3DModelBuilder::Build(PrimitiveModelType::Cube);
    BoundingBox b = cube.Bounds();
    REQUIRE_THAT(b.max.x - b.min.x, WithinAbs(1.0f, 1e-5f));

    for (auto type : { PrimitiveModelType::Plane, PrimitiveModelType::Sphere, PrimitiveModelType::Cylinder,
                       PrimitiveModelType::Torus, PrimitiveModelType::Teapot, PrimitiveModelType::Cone,
                       PrimitiveModelType::Capsule }) {
        INFO(ToString(type));
        REQUIRE_FALSE(Procedural3DModelBuilder::Build(type).Empty());
    }
}

TEST_CASE("Primitive names parse back", "[gfx][procedural]") {
    REQUIRE(ParsePrimitiveModelType("cube") == PrimitiveModelType::Cube);
    REQUIRE(ParsePrimitiveModelType("Capsule") == PrimitiveModelType::Capsule);
    REQUIRE_FALSE(ParsePrimitiveModelType("dodecahedron").has_value());
    REQUIRE(ParsePrimitive2DModelType("TRIANGLE") == Primitive2DModelType::Triangle);
    REQUIRE_FALSE(ParsePrimitive2DModelType("cube").has_value());
}

TEST_CASE("Materials and models", "[gfx][material]") {
    SECTION("default material") {
        MaterialDesc m = CreateMaterial();
        REQUIRE(m.diffuse.r == DefaultMaterialColor.r);
        REQUIRE_THAT(m.metalness, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(m.glossiness, WithinAbs(0.65f, 1e-6f));
    }

    SECTION("explicit colour and surface") {
        MaterialDesc m = CreateMaterial(RED, 0.0f, 0.1f);
        REQUIRE(m.diffuse.r == RED.r);
        REQUIRE(m.diffuse.g == RED.g);
        REQUIRE_THAT(m.glossiness, WithinAbs(0.1f, 1e-6f));
    }

    SECTION("model stays on the CPU until drawn") {
        RenderModel model(GenerateCube({ 1, 1, 1 }));
        model.AddMaterial(CreateMaterial(BLUE));
        REQUIRE_FALSE(model.IsUploaded());
        REQUIRE(model.Materials().size() == 1);
        REQUIRE(model.Meshes().size() == 1);
    }
}
