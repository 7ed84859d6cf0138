// Convex hull colliders as world-space triangle soup with a mid-phase BVH.
// Bodies are pushed out of the triangles as spheres; rays hit the faces.

#include <Physics/StaticMesh.hpp>
#include <raymath.h>
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace Kindling::Physics {

// Closest point on triangle (abc) to point p, Ericson §5.1.5
static Vector3 ClosestPtTriangle(Vector3 p, Vector3 a, Vector3 b, Vector3 c)
{
    Vector3 ab = Vector3Subtract(b, a), ac = Vector3Subtract(c, a), ap = Vector3Subtract(p, a);
    float d1 = Vector3DotProduct(ab, ap), d2 = Vector3DotProduct(ac, ap);
    if (d1 <= 0.f && d2 <= 0.f) return a;

    Vector3 bp = Vector3Subtract(p, b);
    float d3 = Vector3DotProduct(ab, bp), d4 = Vector3DotProduct(ac, bp);
    if (d3 >= 0.f && d4 <= d3) return b;

    float vc = d1 * d4 - d3 * d2;
    if (vc <= 0.f && d1 >= 0.f && d3 <= 0.f)
        return Vector3Add(a, Vector3Scale(ab, d1 / (d1 - d3)));

    Vector3 cp = Vector3Subtract(p, c);
    float d5 = Vector3DotProduct(ab, cp), d6 = Vector3DotProduct(ac, cp);
    if (d6 >= 0.f && d5 <= d6) return c;

    float vb = d5 * d2 - d1 * d6;
    if (vb <= 0.f && d2 >= 0.f && d6 <= 0.f)
        return Vector3Add(a, Vector3Scale(ac, d2 / (d2 - d6)));

    float va = d3 * d6 - d5 * d4;
    float denom = d4 - d3 + d5 - d6;
    if (va <= 0.f && denom > 0.f)
        return Vector3Add(b, Vector3Scale(Vector3Subtract(c, b), (d4 - d3) / denom));

    float dv = 1.f / (va + vb + vc);
    return Vector3Add(a, Vector3Add(Vector3Scale(ab, vb * dv), Vector3Scale(ac, vc * dv)));
}

float RaySphere(Vector3 o, Vector3 d, Vector3 c, float r, float tMin, float tMax)
{
    Vector3 oc = Vector3Subtract(o, c);
    float A = Vector3DotProduct(d, d);
    float B = 2.f * Vector3DotProduct(oc, d);
    float C = Vector3DotProduct(oc, oc) - r * r;
    float disc = B * B - 4.f * A * C;
    if (disc < 0.f || A < 1e-12f) return FLT_MAX;
    float sqrtD = sqrtf(disc);
    float t = (-B - sqrtD) / (2.f * A);
    if (t >= tMin && t <= tMax) return t;
    t = (-B + sqrtD) / (2.f * A);
    if (t >= tMin && t <= tMax) return t;
    return FLT_MAX;
}

// Möller–Trumbore, two-sided. Returns FLT_MAX on miss.
static float RayTriangle(Vector3 o, Vector3 d, Vector3 a, Vector3 b, Vector3 c)
{
    Vector3 e1 = Vector3Subtract(b, a), e2 = Vector3Subtract(c, a);
    Vector3 p  = Vector3CrossProduct(d, e2);
    float det  = Vector3DotProduct(e1, p);
    if (fabsf(det) < 1e-10f) return FLT_MAX;
    float inv = 1.f / det;
    Vector3 s = Vector3Subtract(o, a);
    float u = Vector3DotProduct(s, p) * inv;
    if (u < 0.f || u > 1.f) return FLT_MAX;
    Vector3 q = Vector3CrossProduct(s, e1);
    float v = Vector3DotProduct(d, q) * inv;
    if (v < 0.f || u + v > 1.f) return FLT_MAX;
    float t = Vector3DotProduct(e2, q) * inv;
    return t >= 0.f ? t : FLT_MAX;
}

bool RayAABBIntersect(Vector3 o, Vector3 d, const BoundingBox& b, float& tOut, int& hitAxis)
{
    const float EPS = 1e-8f;
    float ta[3], tb[3];
    const float od[3]   = { o.x, o.y, o.z };
    const float dd[3]   = { d.x, d.y, d.z };
    const float bmin[3] = { b.min.x, b.min.y, b.min.z };
    const float bmax[3] = { b.max.x, b.max.y, b.max.z };
    for (int i = 0; i < 3; ++i) {
        if (fabsf(dd[i]) < EPS) {
            if (od[i] < bmin[i] || od[i] > bmax[i]) return false;
            ta[i] = -INFINITY; tb[i] = INFINITY;
        } else {
            float t1 = (bmin[i] - od[i]) / dd[i];
            float t2 = (bmax[i] - od[i]) / dd[i];
            ta[i] = fminf(t1, t2);
            tb[i] = fmaxf(t1, t2);
        }
    }
    float tmin = fmaxf(fmaxf(ta[0], ta[1]), ta[2]);
    float tmax = fminf(fminf(tb[0], tb[1]), tb[2]);
    if (tmax < 0.0f || tmin > tmax) return false;

    hitAxis = 0;
    for (int i = 1; i < 3; ++i)
        if (ta[i] > ta[hitAxis]) hitAxis = i;
    tOut = tmin < 0.0f ? 0.0f : tmin;   // origin inside the box
    return true;
}

// ─── BVH ─────────────────────────────────────────────────────────────────────

StaticMesh::StaticMesh(std::vector<Triangle> tris)
{
    m_tris.reserve(tris.size());
    for (const auto& t : tris)
        m_tris.push_back({ t.a, t.b, t.c, Vector3Scale(Vector3Add(t.a, Vector3Add(t.b, t.c)), 1.f / 3.f) });
    if (m_tris.empty()) return;
    m_nodes.reserve(m_tris.size() * 2);
    BuildNode(0, (int)m_tris.size());
}

StaticMesh StaticMesh::FromConvexHull(const ConvexHullShape& hull, const Matrix& world)
{
    std::vector<Triangle> tris;
    for (std::size_t h = 0; h < hull.hulls.size() && h < hull.hullIndices.size(); ++h) {
        const auto& pts = hull.hulls[h];
        const auto& idx = hull.hullIndices[h];
        auto at = [&](uint32_t i) { return Vector3Transform(Vector3Multiply(pts[i], hull.scaling), world); };
        for (std::size_t i = 0; i + 2 < idx.size(); i += 3) {
            if (idx[i] >= pts.size() || idx[i + 1] >= pts.size() || idx[i + 2] >= pts.size()) continue;
            tris.push_back({ at(idx[i]), at(idx[i + 1]), at(idx[i + 2]) });
        }
    }
    return StaticMesh(std::move(tris));
}

BoundingBox StaticMesh::Bounds() const
{
    if (m_nodes.empty()) return { { 0, 0, 0 }, { 0, 0, 0 } };
    return { m_nodes[0].bmin, m_nodes[0].bmax };
}

int StaticMesh::BuildNode(int start, int end)
{
    int nodeIdx = (int)m_nodes.size();
    m_nodes.push_back({});

    Vector3 bmin = m_tris[start].a, bmax = m_tris[start].a;
    for (int i = start; i < end; ++i)
        for (const Vector3& v : { m_tris[i].a, m_tris[i].b, m_tris[i].c }) {
            bmin = Vector3Min(bmin, v);
            bmax = Vector3Max(bmax, v);
        }
    m_nodes[nodeIdx].bmin = bmin;
    m_nodes[nodeIdx].bmax = bmax;

    int count = end - start;
    if (count <= 4) {
        m_nodes[nodeIdx].triStart = start;
        m_nodes[nodeIdx].triCount = count;
        return nodeIdx;
    }

    // Split on the longest axis at the mean centroid
    Vector3 ext = Vector3Subtract(bmax, bmin);
    int axis = (ext.x > ext.y && ext.x > ext.z) ? 0 : (ext.y > ext.z ? 1 : 2);
    auto component = [axis](const Tri& t) { return axis == 0 ? t.centroid.x : (axis == 1 ? t.centroid.y : t.centroid.z); };
    float mid = 0.f;
    for (int i = start; i < end; ++i) mid += component(m_tris[i]);
    mid /= (float)count;

    auto midIt = std::partition(m_tris.begin() + start, m_tris.begin() + end,
                                [&](const Tri& t) { return component(t) < mid; });
    int split = (int)(midIt - m_tris.begin());
    if (split == start || split == end) split = start + count / 2;

    m_nodes[nodeIdx].triStart = -1;
    BuildNode(start, split);
    int right = BuildNode(split, end);
    m_nodes[nodeIdx].rightChild = right;
    return nodeIdx;
}

static bool AabbOverlap(Vector3 bmin, Vector3 bmax, Vector3 qmin, Vector3 qmax)
{
    return bmin.x <= qmax.x && bmax.x >= qmin.x &&
           bmin.y <= qmax.y && bmax.y >= qmin.y &&
           bmin.z <= qmax.z && bmax.z >= qmin.z;
}

void StaticMesh::PenetrationNode(int nodeIdx, Vector3 center, float radius, Vector3& push, bool& pushed) const
{
    const Node& node = m_nodes[nodeIdx];
    Vector3 r = { radius, radius, radius };
    if (!AabbOverlap(node.bmin, node.bmax, Vector3Subtract(center, r), Vector3Add(center, r))) return;

    if (node.rightChild == -1) {
        for (int i = node.triStart; i < node.triStart + node.triCount; ++i) {
            const Tri& tri = m_tris[i];
            Vector3 diff  = Vector3Subtract(center, ClosestPtTriangle(center, tri.a, tri.b, tri.c));
            float   dist2 = Vector3DotProduct(diff, diff);
            if (dist2 >= radius * radius) continue;
            float dist = sqrtf(dist2);
            Vector3 n = dist > 1e-6f
                ? Vector3Scale(diff, 1.f / dist)
                : Vector3Normalize(Vector3CrossProduct(Vector3Subtract(tri.b, tri.a), Vector3Subtract(tri.c, tri.a)));
            push   = Vector3Add(push, Vector3Scale(n, radius - dist));
            pushed = true;
        }
        return;
    }
    PenetrationNode(nodeIdx + 1,     center, radius, push, pushed);
    PenetrationNode(node.rightChild, center, radius, push, pushed);
}

void StaticMesh::RayNode(int nodeIdx, Vector3 o, Vector3 d, float& bestT, Vector3& bestN) const
{
    const Node& node = m_nodes[nodeIdx];
    float tBox; int axis;
    if (!RayAABBIntersect(o, d, { node.bmin, node.bmax }, tBox, axis) || tBox > bestT) return;

    if (node.rightChild == -1) {
        for (int i = node.triStart; i < node.triStart + node.triCount; ++i) {
            const Tri& tri = m_tris[i];
            float t = RayTriangle(o, d, tri.a, tri.b, tri.c);
            if (t >= bestT) continue;
            bestT = t;
            bestN = Vector3Normalize(Vector3CrossProduct(Vector3Subtract(tri.b, tri.a), Vector3Subtract(tri.c, tri.a)));
            if (Vector3DotProduct(bestN, d) > 0.f) bestN = Vector3Negate(bestN);
        }
        return;
    }
    RayNode(nodeIdx + 1,     o, d, bestT, bestN);
    RayNode(node.rightChild, o, d, bestT, bestN);
}

bool StaticMesh::ResolveSphere(Vector3& center, float radius) const
{
    if (m_nodes.empty()) return false;
    Vector3 push   = { 0, 0, 0 };
    bool    pushed = false;
    PenetrationNode(0, center, radius, push, pushed);
    if (pushed) center = Vector3Add(center, push);
    return pushed;
}

RaycastResult StaticMesh::Raycast(Vector3 origin, Vector3 dir, float maxDist) const
{
    RaycastResult res;
    if (m_nodes.empty()) return res;

    float   bestT = maxDist;
    Vector3 bestN = { 0, 1, 0 };
    RayNode(0, origin, dir, bestT, bestN);
    if (bestT >= maxDist) return res;

    res.hit      = true;
    res.distance = bestT;
    res.normal   = bestN;
    res.point    = Vector3Add(origin, Vector3Scale(dir, bestT));
    return res;
}

} // namespace Kindling::Physics
