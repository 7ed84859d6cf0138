#pragma once

#include <raylib.h>
#include <cstdint>
#include <vector>

namespace Kindling::GFX {

struct Vertex {
    Vector3 position = { 0, 0, 0 };
    Vector3 normal   = { 0, 1, 0 };
    Vector2 texcoord = { 0, 0 };
};

// CPU-side geometry produced by the procedural builders. Nothing here touches
// the GPU; RenderModel uploads it on first draw.
struct MeshData {
    std::vector<Vertex>   vertices;
    std::vector<uint16_t> indices;   // triangle list, counter-clockwise front faces

    int VertexCount()   const { return (int)vertices.size(); }
    int TriangleCount() const { return (int)indices.size() / 3; }
    bool Empty()        const { return vertices.empty(); }

    BoundingBox          Bounds() const;
    std::vector<Vector3> Positions() const;

    // Append a triangle / quad whose corners are given counter-clockwise as
    // seen from the outside. The face normal is derived from the winding.
    void AddTriangle(Vector3 a, Vector3 b, Vector3 c);
    void AddQuad(Vector3 a, Vector3 b, Vector3 c, Vector3 d);
};

} // namespace Kindling::GFX
