#include <Engine/Scene.hpp>
#include <algorithm>

namespace Kindling {

Scene::Scene(std::string name)
    : m_name(std::move(name))
{}

Scene::~Scene()
{
    Clear();
}

Entity* Scene::Add(std::shared_ptr<Entity> entity)
{
    if (!entity) return nullptr;
    if (entity->m_scene == this && !entity->m_parent) return entity.get();
    entity->RemoveFromScene();
    entity->m_scene = this;
    m_entities.push_back(entity);
    return entity.get();
}

bool Scene::Remove(const Entity* entity)
{
    auto it = std::find_if(m_entities.begin(), m_entities.end(),
                           [entity](const auto& e) { return e.get() == entity; });
    if (it == m_entities.end()) return false;
    std::shared_ptr<Entity> keep = *it;
    m_entities.erase(it);
    keep->m_scene = nullptr;
    return true;
}

std::size_t Scene::RemoveAll(const std::string& name)
{
    std::size_t removed = 0;
    auto it = std::remove_if(m_entities.begin(), m_entities.end(), [&](const auto& e) {
        if (e->GetName() != name) return false;
        e->m_scene = nullptr;
        ++removed;
        return true;
    });
    m_entities.erase(it, m_entities.end());
    return removed;
}

std::size_t Scene::Count(const std::string& name) const
{
    return (std::size_t)std::count_if(m_entities.begin(), m_entities.end(),
                                      [&](const auto& e) { return e->GetName() == name; });
}

Entity* Scene::FindFirst(const std::string& name) const
{
    for (const auto& e : m_entities)
        if (e->GetName() == name) return e.get();
    return nullptr;
}

void Scene::Clear()
{
    for (auto& e : m_entities) e->m_scene = nullptr;
    m_entities.clear();
}

static void VisitTree(const std::shared_ptr<Entity>& e, const std::function<void(Entity&)>& visitor)
{
    std::vector<std::shared_ptr<Entity>> children = e->Children();
    visitor(*e);
    for (const auto& c : children) VisitTree(c, visitor);
}

void Scene::Visit(const std::function<void(Entity&)>& visitor) const
{
    std::vector<std::shared_ptr<Entity>> snapshot = m_entities;
    for (const auto& e : snapshot) VisitTree(e, visitor);
}

} // namespace Kindling
