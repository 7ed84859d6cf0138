#include <Engine/Entity.hpp>
#include <Engine/Scene.hpp>
#include <algorithm>

namespace Kindling {

Matrix Transform::LocalMatrix() const
{
    Matrix s = MatrixScale(scale.x, scale.y, scale.z);
    Matrix r = QuaternionToMatrix(rotation);
    Matrix t = MatrixTranslate(position.x, position.y, position.z);
    return MatrixMultiply(MatrixMultiply(s, r), t);
}

Quaternion Transform::YawPitchRoll(float yaw, float pitch, float roll)
{
    Quaternion qy = QuaternionFromAxisAngle({ 0, 1, 0 }, yaw * DEG2RAD);
    Quaternion qx = QuaternionFromAxisAngle({ 1, 0, 0 }, pitch * DEG2RAD);
    Quaternion qz = QuaternionFromAxisAngle({ 0, 0, 1 }, roll * DEG2RAD);
    return QuaternionMultiply(qy, QuaternionMultiply(qx, qz));
}

Entity::Entity(std::string name)
    : m_name(std::move(name))
{}

Entity::~Entity()
{
    for (auto& c : m_components) c->m_entity = nullptr;
    for (auto& child : m_children) child->m_parent = nullptr;
}

void Entity::Add(std::shared_ptr<EntityComponent> component)
{
    if (!component) return;
    if (component->m_entity == this) return;
    if (component->m_entity) component->m_entity->Remove(component.get());
    component->m_entity = this;
    m_components.push_back(std::move(component));
}

bool Entity::Remove(const EntityComponent* component)
{
    auto it = std::find_if(m_components.begin(), m_components.end(),
                           [component](const auto& c) { return c.get() == component; });
    if (it == m_components.end()) return false;
    (*it)->m_entity = nullptr;
    m_components.erase(it);
    return true;
}

void Entity::AddChild(std::shared_ptr<Entity> child)
{
    if (!child || child.get() == this) return;
    child->RemoveFromScene();
    child->m_parent = this;
    m_children.push_back(std::move(child));
}

bool Entity::RemoveChild(const Entity* child)
{
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [child](const auto& e) { return e.get() == child; });
    if (it == m_children.end()) return false;
    std::shared_ptr<Entity> keep = *it;
    m_children.erase(it);
    keep->m_parent = nullptr;
    return true;
}

Entity* Entity::FindChild(const std::string& name) const
{
    for (const auto& c : m_children)
        if (c->m_name == name) return c.get();
    return nullptr;
}

Scene* Entity::GetScene() const
{
    const Entity* e = this;
    while (e->m_parent) e = e->m_parent;
    return e->m_scene;
}

void Entity::RemoveFromScene()
{
    if (m_parent) { m_parent->RemoveChild(this); return; }
    if (m_scene) m_scene->Remove(this);
}

Matrix Entity::WorldMatrix() const
{
    Matrix local = transform.LocalMatrix();
    return m_parent ? MatrixMultiply(local, m_parent->WorldMatrix()) : local;
}

Vector3 Entity::WorldPosition() const
{
    return m_parent ? Vector3Transform(transform.position, m_parent->WorldMatrix())
                    : transform.position;
}

} // namespace Kindling
