#pragma once

#include <Engine/Entity.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Kindling {

// Flat list of root entities. Children hang off their parents.
class Scene {
public:
    explicit Scene(std::string name = "RootScene");
    ~Scene();

    Scene(const Scene&)            = delete;
    Scene& operator=(const Scene&) = delete;

    const std::string& GetName() const { return m_name; }

    // Adds a root entity (detaching it from wherever it was) and returns it.
    Entity* Add(std::shared_ptr<Entity> entity);
    bool    Remove(const Entity* entity);

    // Root entities only, matching on exact name.
    std::size_t RemoveAll(const std::string& name);
    std::size_t Count(const std::string& name) const;
    Entity*     FindFirst(const std::string& name) const;

    std::size_t Size() const { return m_entities.size(); }
    void        Clear();

    const std::vector<std::shared_ptr<Entity>>& Entities() const { return m_entities; }

    // Depth-first walk over a snapshot of the tree; entities added or removed
    // by the visitor do not affect the current walk.
    void Visit(const std::function<void(Entity&)>& visitor) const;

    template <class T>
    void ForEach(const std::function<void(Entity&, T&)>& fn) const
    {
        Visit([&fn](Entity& e) {
            for (T* c : e.GetAll<T>()) fn(e, *c);
        });
    }

private:
    std::string                          m_name;
    std::vector<std::shared_ptr<Entity>> m_entities;
};

} // namespace Kindling
