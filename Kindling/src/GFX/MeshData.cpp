#include <GFX/MeshData.hpp>
#include <raymath.h>
#include <algorithm>

namespace Kindling::GFX {

BoundingBox MeshData::Bounds() const
{
    if (vertices.empty()) return { { 0, 0, 0 }, { 0, 0, 0 } };
    BoundingBox b{ vertices[0].position, vertices[0].position };
    for (const auto& v : vertices) {
        b.min = Vector3Min(b.min, v.position);
        b.max = Vector3Max(b.max, v.position);
    }
    return b;
}

std::vector<Vector3> MeshData::Positions() const
{
    std::vector<Vector3> out;
    out.reserve(vertices.size());
    for (const auto& v : vertices) out.push_back(v.position);
    return out;
}

void MeshData::AddTriangle(Vector3 a, Vector3 b, Vector3 c)
{
    Vector3 n = Vector3Normalize(Vector3CrossProduct(Vector3Subtract(b, a), Vector3Subtract(c, a)));
    uint16_t base = (uint16_t)vertices.size();
    vertices.push_back({ a, n, { 0, 0 } });
    vertices.push_back({ b, n, { 1, 0 } });
    vertices.push_back({ c, n, { 0.5f, 1 } });
    indices.insert(indices.end(), { base, (uint16_t)(base + 1), (uint16_t)(base + 2) });
}

void MeshData::AddQuad(Vector3 a, Vector3 b, Vector3 c, Vector3 d)
{
    Vector3 n = Vector3Normalize(Vector3CrossProduct(Vector3Subtract(b, a), Vector3Subtract(c, a)));
    uint16_t base = (uint16_t)vertices.size();
    vertices.push_back({ a, n, { 0, 0 } });
    vertices.push_back({ b, n, { 1, 0 } });
    vertices.push_back({ c, n, { 1, 1 } });
    vertices.push_back({ d, n, { 0, 1 } });
    indices.insert(indices.end(), { base, (uint16_t)(base + 1), (uint16_t)(base + 2),
                                    base, (uint16_t)(base + 2), (uint16_t)(base + 3) });
}

} // namespace Kindling::GFX
