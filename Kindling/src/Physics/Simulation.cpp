#include <Physics/Simulation.hpp>
#include <Physics/StaticMesh.hpp>
#include <raymath.h>
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <vector>

namespace Kindling::Physics {

namespace {

struct Body {
    PhysicsComponent* pc;
    Entity*           entity;
    BoundingBox       box;
    Vector3           delta;      // motion during the current step
    float             invMass;
};

struct StaticPlane {
    Vector3 normal;
    float   offset;
};

inline float Comp(const Vector3& v, int i) { return i == 0 ? v.x : (i == 1 ? v.y : v.z); }

inline Vector3 AxisVector(int i, float s)
{
    return { i == 0 ? s : 0.0f, i == 1 ? s : 0.0f, i == 2 ? s : 0.0f };
}

inline bool Overlaps(const BoundingBox& a, const BoundingBox& b, int skipAxis = -1)
{
    for (int i = 0; i < 3; ++i) {
        if (i == skipAxis) continue;
        if (Comp(a.max, i) < Comp(b.min, i) || Comp(a.min, i) > Comp(b.max, i)) return false;
    }
    return true;
}

inline BoundingBox Shifted(const BoundingBox& b, Vector3 d)
{
    return { Vector3Add(b.min, d), Vector3Add(b.max, d) };
}

Matrix ShapeMatrix(const ColliderShapeDesc& shape, const Matrix& world)
{
    Matrix local = MatrixMultiply(QuaternionToMatrix(shape.localRotation),
                                  MatrixTranslate(shape.localOffset.x, shape.localOffset.y, shape.localOffset.z));
    return MatrixMultiply(local, world);
}

StaticPlane WorldPlane(const StaticPlaneShape& p, const Entity& e)
{
    Matrix  world  = e.WorldMatrix();
    Vector3 origin = Vector3Transform({ 0, 0, 0 }, world);
    Vector3 n      = Vector3Normalize(Vector3Subtract(Vector3Transform(p.normal, world), origin));
    return { n, p.offset + Vector3DotProduct(n, origin) };
}

void Translate(Body& b, Vector3 push)
{
    push = Vector3Multiply(push, b.pc->linearFactor);
    b.entity->transform.position = Vector3Add(b.entity->transform.position, push);
    b.box = Shifted(b.box, push);
}

// Cancel velocity into the contact normal and damp the sliding part.
void Bounce(Body& b, Vector3 n, float step)
{
    Vector3& v  = b.pc->linearVelocity;
    float    vn = Vector3DotProduct(v, n);
    if (vn >= 0.0f) return;
    v = Vector3Subtract(v, Vector3Scale(n, vn * (1.0f + b.pc->restitution)));

    Vector3 vt   = Vector3Subtract(v, Vector3Scale(n, Vector3DotProduct(v, n)));
    float   damp = std::max(0.0f, 1.0f - b.pc->friction * step * 10.0f);
    v = Vector3Add(Vector3Scale(n, Vector3DotProduct(v, n)), Vector3Scale(vt, damp));
    v = Vector3Multiply(v, b.pc->linearFactor);
}

// Push `b` out of the static box `s`. A face the body crossed during this step
// wins over the shallowest overlap so thin statics cannot be tunnelled through.
bool ResolveBox(Body& b, const BoundingBox& s, float step)
{
    BoundingBox prev  = Shifted(b.box, Vector3Negate(b.delta));
    BoundingBox swept = { Vector3Min(prev.min, b.box.min), Vector3Max(prev.max, b.box.max) };
    if (!Overlaps(swept, s)) return false;

    const Vector3& factor = b.pc->linearFactor;
    int   bestAxis  = -1;
    float bestEntry = -1.0f;
    float bestPush  = 0.0f;

    for (int i = 0; i < 3; ++i) {
        if (Comp(factor, i) == 0.0f) continue;
        float d = Comp(b.delta, i);
        float entry, push;
        if (Comp(prev.max, i) <= Comp(s.min, i) && d > 0.0f) {
            entry = (Comp(s.min, i) - Comp(prev.max, i)) / d;
            push  = Comp(s.min, i) - Comp(b.box.max, i);
        } else if (Comp(prev.min, i) >= Comp(s.max, i) && d < 0.0f) {
            entry = (Comp(s.max, i) - Comp(prev.min, i)) / d;
            push  = Comp(s.max, i) - Comp(b.box.min, i);
        } else {
            continue;
        }
        if (entry > 1.0f) continue;
        if (!Overlaps(Shifted(prev, Vector3Scale(b.delta, entry)), s, i)) continue;
        if (entry > bestEntry) { bestEntry = entry; bestAxis = i; bestPush = push; }
    }

    if (bestAxis < 0) {
        if (!Overlaps(b.box, s)) return false;
        float bestPen = FLT_MAX;
        for (int i = 0; i < 3; ++i) {
            if (Comp(factor, i) == 0.0f) continue;
            float up   = Comp(s.max, i) - Comp(b.box.min, i);
            float down = Comp(b.box.max, i) - Comp(s.min, i);
            if (up < bestPen)   { bestPen = up;   bestAxis = i; bestPush = up; }
            if (down < bestPen) { bestPen = down; bestAxis = i; bestPush = -down; }
        }
        if (bestAxis < 0) return false;
    }

    Translate(b, AxisVector(bestAxis, bestPush));
    Bounce(b, AxisVector(bestAxis, bestPush >= 0.0f ? 1.0f : -1.0f), step);
    return true;
}

bool ResolvePlane(Body& b, const StaticPlane& p, float step)
{
    Vector3 c = Vector3Scale(Vector3Add(b.box.min, b.box.max), 0.5f);
    Vector3 h = Vector3Scale(Vector3Subtract(b.box.max, b.box.min), 0.5f);
    float support = Vector3DotProduct(p.normal, c)
                  - (fabsf(p.normal.x) * h.x + fabsf(p.normal.y) * h.y + fabsf(p.normal.z) * h.z);
    float pen = p.offset - support;
    if (pen <= 0.0f) return false;
    Translate(b, Vector3Scale(p.normal, pen));
    Bounce(b, p.normal, step);
    return true;
}

bool ResolveMesh(Body& b, const StaticMesh& mesh, float step)
{
    Vector3 c = Vector3Scale(Vector3Add(b.box.min, b.box.max), 0.5f);
    Vector3 h = Vector3Scale(Vector3Subtract(b.box.max, b.box.min), 0.5f);
    float r = FLT_MAX;
    for (int i = 0; i < 3; ++i)
        if (Comp(h, i) > 0.005f) r = std::min(r, Comp(h, i));
    if (r == FLT_MAX) return false;

    Vector3 moved = c;
    if (!mesh.ResolveSphere(moved, r)) return false;
    Vector3 push = Vector3Subtract(moved, c);
    Translate(b, push);
    Bounce(b, Vector3Normalize(push), step);
    return true;
}

bool ResolvePair(Body& a, Body& b)
{
    if (!Overlaps(a.box, b.box)) return false;
    float invSum = a.invMass + b.invMass;
    if (invSum <= 0.0f) return false;

    Vector3 ca = Vector3Scale(Vector3Add(a.box.min, a.box.max), 0.5f);
    Vector3 cb = Vector3Scale(Vector3Add(b.box.min, b.box.max), 0.5f);

    int   axis = -1;
    float pen  = FLT_MAX;
    for (int i = 0; i < 3; ++i) {
        if (Comp(a.pc->linearFactor, i) == 0.0f && Comp(b.pc->linearFactor, i) == 0.0f) continue;
        float p = std::min(Comp(a.box.max, i), Comp(b.box.max, i)) - std::max(Comp(a.box.min, i), Comp(b.box.min, i));
        if (p < pen) { pen = p; axis = i; }
    }
    if (axis < 0 || pen <= 0.0f) return false;

    float   sign = Comp(cb, axis) >= Comp(ca, axis) ? 1.0f : -1.0f;
    Vector3 n    = AxisVector(axis, sign);   // from a to b

    Translate(a, Vector3Scale(n, -pen * a.invMass / invSum));
    Translate(b, Vector3Scale(n,  pen * b.invMass / invSum));

    float vn = Vector3DotProduct(Vector3Subtract(b.pc->linearVelocity, a.pc->linearVelocity), n);
    if (vn < 0.0f) {
        float e = std::min(a.pc->restitution, b.pc->restitution);
        float j = -(1.0f + e) * vn / invSum;
        a.pc->linearVelocity = Vector3Multiply(Vector3Subtract(a.pc->linearVelocity, Vector3Scale(n, j * a.invMass)), a.pc->linearFactor);
        b.pc->linearVelocity = Vector3Multiply(Vector3Add(b.pc->linearVelocity, Vector3Scale(n, j * b.invMass)), b.pc->linearFactor);
    }
    return true;
}

} // namespace

Simulation::Simulation(SimulationSettings settings)
    : m_settings(settings)
{}

int Simulation::Step(Scene& scene, float dt)
{
    const float step = m_settings.fixedTimeStep > 0.0f ? m_settings.fixedTimeStep : 1.0f / 60.0f;
    m_accumulator += dt;

    int steps = 0;
    while (m_accumulator >= step && steps < m_settings.maxSubSteps) {
        StepFixed(scene, step);
        m_accumulator -= step;
        ++steps;
    }
    if (steps == m_settings.maxSubSteps && m_accumulator > step) {
        TraceLog(LOG_DEBUG, "[Physics] Dropping %.3fs of simulation backlog", m_accumulator - step);
        m_accumulator = step;
    }
    return steps;
}

void Simulation::StepFixed(Scene& scene, float step)
{
    std::vector<Body>        bodies;
    std::vector<BoundingBox> boxes;
    std::vector<StaticPlane> planes;
    std::vector<StaticMesh>  meshes;

    scene.ForEach<PhysicsComponent>([&](Entity& e, PhysicsComponent& pc) {
        if (pc.IsDynamic()) {
            bodies.push_back({ &pc, &e, {}, { 0, 0, 0 }, pc.mass > 0.0f ? 1.0f / pc.mass : 0.0f });
            return;
        }
        Matrix world = e.WorldMatrix();
        for (const auto& shape : pc.Shapes()) {
            if (auto* p = shape.As<StaticPlaneShape>())
                planes.push_back(WorldPlane(*p, e));
            else if (auto* h = shape.As<ConvexHullShape>())
                meshes.push_back(StaticMesh::FromConvexHull(*h, ShapeMatrix(shape, world)));
            else
                boxes.push_back(shape.WorldBounds(world));
        }
    });

    // Integrate
    for (auto& b : bodies) {
        PhysicsComponent& pc = *b.pc;
        Transform&        t  = b.entity->transform;

        if (pc.gravity) pc.linearVelocity = Vector3Add(pc.linearVelocity, Vector3Scale(m_settings.gravity, step));
        pc.linearVelocity  = Vector3Multiply(pc.linearVelocity, pc.linearFactor);
        pc.angularVelocity = Vector3Multiply(pc.angularVelocity, pc.angularFactor);

        b.delta    = Vector3Scale(pc.linearVelocity, step);
        t.position = Vector3Add(t.position, b.delta);

        float w = Vector3Length(pc.angularVelocity);
        if (w > 1e-6f) {
            Quaternion dq = QuaternionFromAxisAngle(Vector3Scale(pc.angularVelocity, 1.0f / w), w * step);
            t.rotation = QuaternionNormalize(QuaternionMultiply(dq, t.rotation));
        }
    }

    // Bounds after integration; shapeless bodies just fall
    bodies.erase(std::remove_if(bodies.begin(), bodies.end(),
                                [](Body& b) { return !b.pc->WorldBounds(b.box); }),
                 bodies.end());

    int contacts = 0;
    auto resolveStatics = [&](Body& b) {
        for (const auto& p : planes) contacts += ResolvePlane(b, p, step);
        for (const auto& s : boxes)  contacts += ResolveBox(b, s, step);
        for (const auto& m : meshes) contacts += ResolveMesh(b, m, step);
    };

    for (auto& b : bodies) resolveStatics(b);

    // Sort-and-sweep on X for body pairs
    std::sort(bodies.begin(), bodies.end(),
              [](const Body& a, const Body& b) { return a.box.min.x < b.box.min.x; });
    for (std::size_t i = 0; i < bodies.size(); ++i)
        for (std::size_t j = i + 1; j < bodies.size() && bodies[j].box.min.x <= bodies[i].box.max.x; ++j)
            contacts += ResolvePair(bodies[i], bodies[j]);

    // Pairs may have pushed bodies back into the ground
    for (auto& b : bodies) {
        b.delta = { 0, 0, 0 };
        resolveStatics(b);
    }

    m_lastBodies   = (int)bodies.size();
    m_lastContacts = contacts;
}

RaycastResult Simulation::Raycast(const Scene& scene, Vector3 origin, Vector3 dir, float maxDistance) const
{
    RaycastResult best;
    float len = Vector3Length(dir);
    if (len < 1e-8f) return best;
    dir = Vector3Scale(dir, 1.0f / len);

    float bestT = maxDistance;
    auto take = [&](float t, Vector3 normal, Entity& e, PhysicsComponent& pc) {
        if (t < 0.0f || t >= bestT) return;
        bestT            = t;
        best.hit         = true;
        best.distance    = t;
        best.point       = Vector3Add(origin, Vector3Scale(dir, t));
        best.normal      = normal;
        best.entity      = &e;
        best.component   = &pc;
    };

    scene.ForEach<PhysicsComponent>([&](Entity& e, PhysicsComponent& pc) {
        Matrix world = e.WorldMatrix();
        for (const auto& shape : pc.Shapes()) {
            if (auto* p = shape.As<StaticPlaneShape>()) {
                StaticPlane wp = WorldPlane(*p, e);
                float denom = Vector3DotProduct(wp.normal, dir);
                if (fabsf(denom) < 1e-8f) continue;
                float t = (wp.offset - Vector3DotProduct(wp.normal, origin)) / denom;
                take(t, denom < 0.0f ? wp.normal : Vector3Negate(wp.normal), e, pc);
            } else if (auto* s = shape.As<SphereShape>()) {
                Matrix  m = ShapeMatrix(shape, world);
                Vector3 c = Vector3Transform({ 0, 0, 0 }, m);
                Vector3 sc = e.transform.scale;
                float   r = s->radius * std::max(fabsf(sc.x), std::max(fabsf(sc.y), fabsf(sc.z)));
                float   t = RaySphere(origin, dir, c, r, 0.0f, bestT);
                if (t != FLT_MAX) take(t, Vector3Normalize(Vector3Subtract(Vector3Add(origin, Vector3Scale(dir, t)), c)), e, pc);
            } else if (auto* h = shape.As<ConvexHullShape>()) {
                RaycastResult r = StaticMesh::FromConvexHull(*h, ShapeMatrix(shape, world)).Raycast(origin, dir, bestT);
                if (r) take(r.distance, r.normal, e, pc);
            } else {
                float t; int axis;
                if (!RayAABBIntersect(origin, dir, shape.WorldBounds(world), t, axis)) continue;
                take(t, AxisVector(axis, Comp(dir, axis) > 0.0f ? -1.0f : 1.0f), e, pc);
            }
        }
    });
    return best;
}

} // namespace Kindling::Physics
