#pragma once

// ── Kindling::Physics components ────────────────────────────────────────────
//
// Two families, matching the two ways collider shapes get attached:
//
//   ColliderComponent     owns a flat `colliderShapes` list
//     StaticColliderComponent, RigidbodyComponent
//   CollidableComponent   owns a CompoundCollider
//     StaticComponent, BodyComponent, Body2DComponent
//
// The Simulation treats both the same way through PhysicsComponent.

#include <Engine/Entity.hpp>
#include <Physics/ColliderShape.hpp>
#include <raylib.h>
#include <vector>

namespace Kindling::Physics {

class PhysicsComponent : public EntityComponent {
public:
    virtual const std::vector<ColliderShapeDesc>& Shapes() const = 0;
    virtual std::vector<ColliderShapeDesc>&       Shapes()       = 0;

    // Dynamic bodies are integrated; static ones only get collided against.
    virtual bool IsDynamic() const = 0;

    Vector3 linearVelocity  = { 0, 0, 0 };
    Vector3 angularVelocity = { 0, 0, 0 };

    // Per-axis multipliers on motion: 0 locks an axis.
    Vector3 linearFactor  = { 1, 1, 1 };
    Vector3 angularFactor = { 1, 1, 1 };

    float mass        = 1.0f;
    float restitution = 0.0f;
    float friction    = 0.5f;
    bool  gravity     = true;
    bool  kinematic   = false;

    // World-space bounds of all non-plane shapes. Returns false when the
    // component has no bounded shape or is not attached to an entity.
    bool WorldBounds(BoundingBox& out) const;
};

// ── Flat collider list ───────────────────────────────────────────────────────

class ColliderComponent : public PhysicsComponent {
public:
    std::vector<ColliderShapeDesc> colliderShapes;

    const std::vector<ColliderShapeDesc>& Shapes() const override { return colliderShapes; }
    std::vector<ColliderShapeDesc>&       Shapes() override       { return colliderShapes; }
};

class StaticColliderComponent : public ColliderComponent {
public:
    bool IsDynamic() const override { return false; }
};

class RigidbodyComponent : public ColliderComponent {
public:
    bool IsDynamic() const override { return !kinematic; }
};

// ── Compound collider ───────────────────────────────────────────────────────

struct CompoundCollider {
    std::vector<ColliderShapeDesc> colliders;
};

class CollidableComponent : public PhysicsComponent {
public:
    CompoundCollider collider;

    const std::vector<ColliderShapeDesc>& Shapes() const override { return collider.colliders; }
    std::vector<ColliderShapeDesc>&       Shapes() override       { return collider.colliders; }
};

class StaticComponent : public CollidableComponent {
public:
    bool IsDynamic() const override { return false; }
};

class BodyComponent : public CollidableComponent {
public:
    bool IsDynamic() const override { return !kinematic; }
};

// Body confined to the XY plane, rotating about Z only.
class Body2DComponent : public BodyComponent {
public:
    Body2DComponent()
    {
        linearFactor  = { 1, 1, 0 };
        angularFactor = { 0, 0, 1 };
    }
};

} // namespace Kindling::Physics
