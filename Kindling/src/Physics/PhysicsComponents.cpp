#include <Physics/PhysicsComponents.hpp>
#include <raymath.h>

namespace Kindling::Physics {

bool PhysicsComponent::WorldBounds(BoundingBox& out) const
{
    const Entity* e = GetEntity();
    if (!e) return false;

    Matrix world = e->WorldMatrix();
    bool   any   = false;

    for (const auto& shape : Shapes()) {
        if (shape.Type() == ColliderShapeType::StaticPlane) continue;
        BoundingBox wb = shape.WorldBounds(world);

        if (!any) { out = wb; any = true; continue; }
        out.min = Vector3Min(out.min, wb.min);
        out.max = Vector3Max(out.max, wb.max);
    }
    return any;
}

} // namespace Kindling::Physics
