#pragma once

// ── Kindling::Physics::Simulation ───────────────────────────────────────────
//
// A deliberately small rigid-body stepper: gravity, per-axis motion factors,
// push-out contacts against static colliders and between dynamic bodies.
// There is no constraint solver and no contact manifold; bodies are treated
// as their world-space bounds (convex hull statics use the triangle BVH).
//
// Bodies are integrated in their parent's space and are expected to be root
// entities of the scene.

#include <Engine/Scene.hpp>
#include <Physics/PhysicsComponents.hpp>
#include <Physics/PhysicsHelpers.hpp>
#include <raylib.h>

namespace Kindling::Physics {

struct SimulationSettings {
    Vector3 gravity       = { 0.0f, -9.81f, 0.0f };
    float   fixedTimeStep = 1.0f / 60.0f;
    int     maxSubSteps   = 4;
};

class Simulation {
public:
    explicit Simulation(SimulationSettings settings = {});

    SimulationSettings&       Settings()       { return m_settings; }
    const SimulationSettings& Settings() const { return m_settings; }

    // Advance by `dt`, running as many fixed sub-steps as fit (capped).
    // Returns the number of sub-steps taken.
    int  Step(Scene& scene, float dt);
    void StepFixed(Scene& scene, float step);

    // Closest collider along the ray. `dir` need not be normalised.
    RaycastResult Raycast(const Scene& scene, Vector3 origin, Vector3 dir, float maxDistance = 1000.0f) const;

    int LastBodyCount()    const { return m_lastBodies; }
    int LastContactCount() const { return m_lastContacts; }

private:
    SimulationSettings m_settings;
    float              m_accumulator  = 0.0f;
    int                m_lastBodies   = 0;
    int                m_lastContacts = 0;
};

} // namespace Kindling::Physics
