#include <GFX/ProceduralModels.hpp>
#include <raymath.h>
#include <cctype>
#include <cmath>
#include <vector>

namespace Kindling::GFX {

namespace {

// One point of a profile swept around the Y axis. (nr, ny) is the outward
// normal in the radial/up plane.
struct ProfilePoint {
    float r, y;
    float nr, ny;
};

MeshData Lathe(const std::vector<ProfilePoint>& profile, int segments)
{
    MeshData m;
    const int rows = (int)profile.size();
    const int cols = segments + 1;
    m.vertices.reserve((size_t)rows * cols);

    for (int j = 0; j < rows; ++j) {
        const ProfilePoint& p = profile[j];
        for (int s = 0; s < cols; ++s) {
            float a = (float)s / segments * 2.0f * PI;
            float c = cosf(a), sn = sinf(a);
            Vertex v;
            v.position = { p.r * c, p.y, p.r * sn };
            v.normal   = Vector3Normalize({ p.nr * c, p.ny, p.nr * sn });
            v.texcoord = { (float)s / segments, 1.0f - (float)j / (rows - 1) };
            m.vertices.push_back(v);
        }
    }

    for (int j = 0; j + 1 < rows; ++j) {
        for (int s = 0; s < segments; ++s) {
            uint16_t i0 = (uint16_t)(j * cols + s);
            uint16_t i1 = (uint16_t)(j * cols + s + 1);
            uint16_t i2 = (uint16_t)((j + 1) * cols + s);
            uint16_t i3 = (uint16_t)((j + 1) * cols + s + 1);
            m.indices.insert(m.indices.end(), { i0, i2, i1, i1, i2, i3 });
        }
    }
    return m;
}

// Normals for a smooth profile: tangent rotated a quarter turn clockwise.
void ComputeProfileNormals(std::vector<ProfilePoint>& profile)
{
    const int n = (int)profile.size();
    for (int i = 0; i < n; ++i) {
        const ProfilePoint& a = profile[i > 0 ? i - 1 : i];
        const ProfilePoint& b = profile[i + 1 < n ? i + 1 : i];
        Vector2 t = Vector2Normalize({ b.r - a.r, b.y - a.y });
        profile[i].nr = t.y;
        profile[i].ny = -t.x;
    }
}

// Extrude a convex outline (counter-clockwise in XY) along Z.
MeshData ExtrudeOutline(const std::vector<Vector2>& outline, float depth)
{
    MeshData m;
    const int n = (int)outline.size();
    const float hz = depth * 0.5f;

    uint16_t front = (uint16_t)m.vertices.size();
    for (const auto& p : outline)
        m.vertices.push_back({ { p.x, p.y, hz }, { 0, 0, 1 }, { p.x, p.y } });
    for (int i = 1; i + 1 < n; ++i)
        m.indices.insert(m.indices.end(), { front, (uint16_t)(front + i), (uint16_t)(front + i + 1) });

    uint16_t back = (uint16_t)m.vertices.size();
    for (const auto& p : outline)
        m.vertices.push_back({ { p.x, p.y, -hz }, { 0, 0, -1 }, { p.x, p.y } });
    for (int i = 1; i + 1 < n; ++i)
        m.indices.insert(m.indices.end(), { back, (uint16_t)(back + i + 1), (uint16_t)(back + i) });

    for (int i = 0; i < n; ++i) {
        const Vector2& a = outline[i];
        const Vector2& b = outline[(i + 1) % n];
        m.AddQuad({ a.x, a.y, -hz }, { b.x, b.y, -hz }, { b.x, b.y, hz }, { a.x, a.y, hz });
    }
    return m;
}

void Append(MeshData& dst, const MeshData& src, const Matrix& rotation, Vector3 offset)
{
    uint16_t base = (uint16_t)dst.vertices.size();
    for (Vertex v : src.vertices) {
        v.position = Vector3Add(Vector3Transform(v.position, rotation), offset);
        v.normal   = Vector3Normalize(Vector3Transform(v.normal, rotation));
        dst.vertices.push_back(v);
    }
    for (uint16_t i : src.indices) dst.indices.push_back((uint16_t)(base + i));
}

} // namespace

const char* ToString(PrimitiveModelType type)
{
    switch (type) {
        case PrimitiveModelType::Plane:           return "Plane";
        case PrimitiveModelType::InfinitePlane:   return "InfinitePlane";
        case PrimitiveModelType::Sphere:          return "Sphere";
        case PrimitiveModelType::Cube:            return "Cube";
        case PrimitiveModelType::Cylinder:        return "Cylinder";
        case PrimitiveModelType::Torus:           return "Torus";
        case PrimitiveModelType::Teapot:          return "Teapot";
        case PrimitiveModelType::Cone:            return "Cone";
        case PrimitiveModelType::Capsule:         return "Capsule";
        case PrimitiveModelType::TriangularPrism: return "TriangularPrism";
    }
    return "Unknown";
}

const char* ToString(Primitive2DModelType type)
{
    switch (type) {
        case Primitive2DModelType::Square:    return "Square";
        case Primitive2DModelType::Rectangle: return "Rectangle";
        case Primitive2DModelType::Circle:    return "Circle";
        case Primitive2DModelType::Triangle:  return "Triangle";
        case Primitive2DModelType::Polygon:   return "Polygon";
        case Primitive2DModelType::Capsule:   return "Capsule";
    }
    return "Unknown";
}

static bool SameName(const std::string& a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size() && b[i]; ++i)
        if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i])) return false;
    return i == a.size() && b[i] == '\0';
}

std::optional<PrimitiveModelType> ParsePrimitiveModelType(const std::string& name)
{
    for (int i = 0; i <= (int)PrimitiveModelType::TriangularPrism; ++i)
        if (SameName(name, ToString((PrimitiveModelType)i))) return (PrimitiveModelType)i;
    return std::nullopt;
}

std::optional<Primitive2DModelType> ParsePrimitive2DModelType(const std::string& name)
{
    for (int i = 0; i <= (int)Primitive2DModelType::Capsule; ++i)
        if (SameName(name, ToString((Primitive2DModelType)i))) return (Primitive2DModelType)i;
    return std::nullopt;
}

Vector3 DefaultSize(PrimitiveModelType type)
{
    switch (type) {
        case PrimitiveModelType::Plane:           return { 1.0f, 1.0f, 0.0f };
        case PrimitiveModelType::InfinitePlane:   return { 1000.0f, 1000.0f, 0.0f };
        case PrimitiveModelType::Sphere:          return { 0.5f, 0.0f, 0.0f };
        case PrimitiveModelType::Cube:            return { 1.0f, 1.0f, 1.0f };
        case PrimitiveModelType::Cylinder:        return { 0.5f, 1.0f, 0.0f };
        case PrimitiveModelType::Torus:           return { 0.5f, 0.16f, 0.0f };
        case PrimitiveModelType::Teapot:          return { 1.0f, 0.0f, 0.0f };
        case PrimitiveModelType::Cone:            return { 0.5f, 1.0f, 0.0f };
        case PrimitiveModelType::Capsule:         return { 0.35f, 0.5f, 0.0f };
        case PrimitiveModelType::TriangularPrism: return { 1.0f, 1.0f, 1.0f };
    }
    return { 1.0f, 1.0f, 1.0f };
}

Vector2 DefaultSize(Primitive2DModelType type)
{
    switch (type) {
        case Primitive2DModelType::Square:    return { 1.0f, 1.0f };
        case Primitive2DModelType::Rectangle: return { 2.0f, 1.0f };
        case Primitive2DModelType::Circle:    return { 0.5f, 0.5f };
        case Primitive2DModelType::Triangle:  return { 1.0f, 1.0f };
        case Primitive2DModelType::Polygon:   return { 0.5f, 0.5f };
        case Primitive2DModelType::Capsule:   return { 1.0f, 0.5f };
    }
    return { 1.0f, 1.0f };
}

MeshData GeneratePlane(float width, float depth)
{
    MeshData m;
    const float hx = width * 0.5f, hz = depth * 0.5f;
    m.AddQuad({ -hx, 0, -hz }, { -hx, 0, hz }, { hx, 0, hz }, { hx, 0, -hz });
    return m;
}

MeshData GenerateCube(Vector3 size)
{
    struct Face { Vector3 n, u, v; };
    static const Face faces[6] = {
        { {  1, 0, 0 }, {  0, 0, -1 }, { 0, 1,  0 } },
        { { -1, 0, 0 }, {  0, 0,  1 }, { 0, 1,  0 } },
        { {  0, 1, 0 }, {  1, 0,  0 }, { 0, 0, -1 } },
        { {  0,-1, 0 }, {  1, 0,  0 }, { 0, 0,  1 } },
        { {  0, 0, 1 }, {  1, 0,  0 }, { 0, 1,  0 } },
        { {  0, 0,-1 }, { -1, 0,  0 }, { 0, 1,  0 } },
    };
    const Vector3 h = Vector3Scale(size, 0.5f);

    MeshData m;
    for (const Face& f : faces) {
        Vector3 c = Vector3Multiply(f.n, h);
        Vector3 u = Vector3Multiply(f.u, h);
        Vector3 v = Vector3Multiply(f.v, h);
        m.AddQuad(Vector3Subtract(Vector3Subtract(c, u), v),
                  Vector3Subtract(Vector3Add(c, u), v),
                  Vector3Add(Vector3Add(c, u), v),
                  Vector3Add(Vector3Subtract(c, u), v));
    }
    return m;
}

MeshData GenerateSphere(float radius, int tessellation)
{
    const int rings = tessellation < 3 ? 3 : tessellation;
    std::vector<ProfilePoint> profile;
    for (int i = 0; i <= rings; ++i) {
        float phi = -PI * 0.5f + PI * (float)i / rings;
        profile.push_back({ radius * cosf(phi), radius * sinf(phi), cosf(phi), sinf(phi) });
    }
    return Lathe(profile, rings * 2);
}

MeshData GenerateCylinder(float radius, float height, int tessellation)
{
    const float h = height * 0.5f;
    return Lathe({
        { 0.0f,   -h, 0, -1 }, { radius, -h, 0, -1 },
        { radius, -h, 1,  0 }, { radius,  h, 1,  0 },
        { radius,  h, 0,  1 }, { 0.0f,    h, 0,  1 },
    }, tessellation < 3 ? 3 : tessellation);
}

MeshData GenerateCone(float radius, float height, int tessellation)
{
    const float h = height * 0.5f;
    Vector2 n = Vector2Normalize({ height, radius });
    return Lathe({
        { 0.0f,   -h, 0, -1 }, { radius, -h, 0, -1 },
        { radius, -h, n.x, n.y }, { 0.0f, h, n.x, n.y },
    }, tessellation < 3 ? 3 : tessellation);
}

MeshData GenerateCapsule(float radius, float length, int tessellation)
{
    const int steps = tessellation < 2 ? 2 : tessellation / 2;
    const float h = length * 0.5f;
    std::vector<ProfilePoint> profile;
    for (int i = 0; i <= steps; ++i) {
        float phi = -PI * 0.5f + PI * 0.5f * (float)i / steps;
        profile.push_back({ radius * cosf(phi), -h + radius * sinf(phi), cosf(phi), sinf(phi) });
    }
    for (int i = 0; i <= steps; ++i) {
        float phi = PI * 0.5f * (float)i / steps;
        profile.push_back({ radius * cosf(phi), h + radius * sinf(phi), cosf(phi), sinf(phi) });
    }
    return Lathe(profile, tessellation < 3 ? 3 : tessellation);
}

MeshData GenerateTorus(float majorRadius, float minorRadius, int tessellation)
{
    const int steps = tessellation < 3 ? 3 : tessellation;
    std::vector<ProfilePoint> profile;
    for (int i = 0; i <= steps; ++i) {
        float b = 2.0f * PI * (float)i / steps;
        profile.push_back({ majorRadius + minorRadius * cosf(b), minorRadius * sinf(b), cosf(b), sinf(b) });
    }
    return Lathe(profile, steps);
}

// Body of revolution with a cone spout and a half-buried ring handle.
MeshData GenerateTeapot(float size, int tessellation)
{
    static const Vector2 body[] = {
        { 0.00f, 0.00f }, { 0.32f, 0.00f }, { 0.42f, 0.06f }, { 0.49f, 0.20f },
        { 0.50f, 0.32f }, { 0.46f, 0.44f }, { 0.36f, 0.52f }, { 0.20f, 0.55f },
        { 0.08f, 0.58f }, { 0.06f, 0.64f }, { 0.00f, 0.66f },
    };
    std::vector<ProfilePoint> profile;
    for (const auto& p : body)
        profile.push_back({ p.x * size, (p.y - 0.33f) * size, 0, 0 });
    ComputeProfileNormals(profile);

    MeshData m = Lathe(profile, tessellation < 3 ? 3 : tessellation);

    MeshData spout = GenerateCone(0.09f * size, 0.45f * size, 12);
    Append(m, spout, MatrixRotateZ(-55.0f * DEG2RAD), { 0.55f * size, 0.05f * size, 0 });

    MeshData handle = GenerateTorus(0.17f * size, 0.035f * size, 12);
    Append(m, handle, MatrixRotateX(90.0f * DEG2RAD), { -0.47f * size, 0.0f, 0 });
    return m;
}

MeshData GenerateTriangularPrism(Vector3 size)
{
    const float hx = size.x * 0.5f, hy = size.y * 0.5f;
    return ExtrudeOutline({ { -hx, -hy }, { hx, -hy }, { 0.0f, hy } }, size.z);
}

MeshData Procedural3DModelBuilder::Build(PrimitiveModelType type, std::optional<Vector3> size)
{
    const Vector3 s = size.value_or(DefaultSize(type));
    switch (type) {
        case PrimitiveModelType::Plane:           return GeneratePlane(s.x, s.y);
        case PrimitiveModelType::InfinitePlane:   return GeneratePlane(1000.0f, 1000.0f);
        case PrimitiveModelType::Sphere:          return GenerateSphere(s.x);
        case PrimitiveModelType::Cube:            return GenerateCube(s);
        case PrimitiveModelType::Cylinder:        return GenerateCylinder(s.x, s.y);
        case PrimitiveModelType::Torus:           return GenerateTorus(s.x, s.y);
        case PrimitiveModelType::Teapot:          return GenerateTeapot(s.x);
        case PrimitiveModelType::Cone:            return GenerateCone(s.x, s.y);
        case PrimitiveModelType::Capsule:         return GenerateCapsule(s.x, s.y);
        case PrimitiveModelType::TriangularPrism: return GenerateTriangularPrism(s);
    }
    return {};
}

MeshData Procedural2DModelBuilder::Build(Primitive2DModelType type, std::optional<Vector2> size, float depth)
{
    const Vector2 s = size.value_or(DefaultSize(type));
    switch (type) {
        case Primitive2DModelType::Square:
        case Primitive2DModelType::Rectangle:
            return GenerateCube({ s.x, s.y, depth });
        case Primitive2DModelType::Circle:
            return GenerateCylinder(s.x, depth);
        case Primitive2DModelType::Triangle:
            return GenerateTriangularPrism({ s.x, s.y, depth });
        case Primitive2DModelType::Polygon: {
            std::vector<Vector2> outline;
            for (int i = 0; i < 5; ++i) {
                float a = PI * 0.5f + 2.0f * PI * (float)i / 5;
                outline.push_back({ s.x * cosf(a), s.x * sinf(a) });
            }
            return ExtrudeOutline(outline, depth);
        }
        case Primitive2DModelType::Capsule: {
            const float r  = s.y * 0.5f;
            const float hx = s.x * 0.5f - r > 0.0f ? s.x * 0.5f - r : 0.0f;
            std::vector<Vector2> outline;
            for (int i = 0; i <= 8; ++i) {
                float a = -PI * 0.5f + PI * (float)i / 8;
                outline.push_back({ hx + r * cosf(a), r * sinf(a) });
            }
            for (int i = 0; i <= 8; ++i) {
                float a = PI * 0.5f + PI * (float)i / 8;
                outline.push_back({ -hx + r * cosf(a), r * sinf(a) });
            }
            return ExtrudeOutline(outline, depth);
        }
    }
    return {};
}

} // namespace Kindling::GFX
