#pragma once
#include <Physics/ColliderShape.hpp>
#include <Physics/PhysicsHelpers.hpp>
#include <raylib.h>
#include <vector>

namespace Kindling::Physics {

// Triangle soup with a mid-phase BVH, used for triangle-accurate contact and
// raycasts against convex hull colliders.
class StaticMesh {
public:
    struct Triangle {
        Vector3 a, b, c;
    };

    StaticMesh() = default;
    explicit StaticMesh(std::vector<Triangle> tris);

    // Triangles of every hull in `hull`, scaled and moved into world space.
    static StaticMesh FromConvexHull(const ConvexHullShape& hull, const Matrix& world);

    bool        Empty() const { return m_nodes.empty(); }
    std::size_t TriangleCount() const { return m_tris.size(); }
    BoundingBox Bounds() const;

    // Push `center` out of every overlapping triangle in one pass. Returns true
    // if any triangle overlapped.
    bool ResolveSphere(Vector3& center, float radius) const;

    // `dir` must be normalised; result `t` is a distance.
    RaycastResult Raycast(Vector3 origin, Vector3 dir, float maxDist) const;

private:
    struct Tri {
        Vector3 a, b, c;
        Vector3 centroid;
    };

    struct Node {
        Vector3 bmin, bmax;
        // Leaf: [triStart, triStart+triCount). Internal: left child = index+1.
        int triStart = 0, triCount = 0;
        int rightChild = -1;   // -1 → leaf
    };

    int  BuildNode(int start, int end);
    void PenetrationNode(int nodeIdx, Vector3 center, float radius, Vector3& push, bool& pushed) const;
    void RayNode(int nodeIdx, Vector3 o, Vector3 d, float& bestT, Vector3& bestN) const;

    std::vector<Node> m_nodes;
    std::vector<Tri>  m_tris;
};

// Shared ray helpers.
// Slab test; `tOut` is the entry distance, `hitAxis` the axis of the entry face.
bool RayAABBIntersect(Vector3 o, Vector3 d, const BoundingBox& b, float& tOut, int& hitAxis);
// t of the first intersection in [tMin, tMax], or FLT_MAX.
float RaySphere(Vector3 o, Vector3 d, Vector3 c, float r, float tMin, float tMax);

} // namespace Kindling::Physics
