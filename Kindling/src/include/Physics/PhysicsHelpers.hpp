#pragma once

// ── Kindling::Physics query results ─────────────────────────────────────────
//
// Raycasts return this by value; it tests true on a hit.
//
//   auto hit = game.GetSimulation().Raycast(game.GetRootScene(), origin, dir);
//   if (hit && hit.entity) { ... }

#include <raylib.h>

namespace Kindling {
class Entity;
}

namespace Kindling::Physics {

class PhysicsComponent;

struct RaycastResult {
    bool    hit      = false;
    Vector3 point    = { 0, 0, 0 };
    Vector3 normal   = { 0, 1, 0 };
    float   distance = 0.0f;    // along the normalised direction

    // Set by Simulation::Raycast; mesh-level queries leave them null.
    Entity*           entity    = nullptr;
    PhysicsComponent* component = nullptr;

    explicit operator bool() const { return hit; }
};

    Vector3 normal   = { 0, 1, 0 };
    float   fraction = 0.0f;    // 0 = start of the segment, 1 = end

    explicit operator bool() const { return hit; }
};

} // namespace Kindling::Physics
