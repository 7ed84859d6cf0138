#pragma once

#include <raylib.h>
#include <raymath.h>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace Kindling {

class Entity;
class Scene;

// Base for everything that can be attached to an Entity.
class EntityComponent {
public:
    virtual ~EntityComponent() = default;

    Entity* GetEntity() const { return m_entity; }

private:
    friend class Entity;
    Entity* m_entity = nullptr;
};

// Position / rotation / scale relative to the parent entity (or the scene).
struct Transform {
    Vector3    position = { 0, 0, 0 };
    Quaternion rotation = { 0, 0, 0, 1 };
    Vector3    scale    = { 1, 1, 1 };

    Matrix LocalMatrix() const;

    // Roll about Z, then pitch about X, then yaw about Y. Degrees.
    static Quaternion YawPitchRoll(float yaw, float pitch, float roll = 0.0f);
};

class Entity {
public:
    explicit Entity(std::string name = "Entity");
    ~Entity();

    Entity(const Entity&)            = delete;
    Entity& operator=(const Entity&) = delete;

    const std::string& GetName() const { return m_name; }
    void SetName(std::string name) { m_name = std::move(name); }

    Transform transform;

    // ── Components ──────────────────────────────────────────────────────────
    void Add(std::shared_ptr<EntityComponent> component);

    template <class T, class... Args>
    std::shared_ptr<T> Add(Args&&... args)
    {
        static_assert(std::is_base_of<EntityComponent, T>::value, "T must derive from EntityComponent");
        auto c = std::make_shared<T>(std::forward<Args>(args)...);
        Add(c);
        return c;
    }

    // First component of type T (or derived from T), nullptr if none.
    template <class T>
    T* Get() const
    {
        for (const auto& c : m_components)
            if (auto* p = dynamic_cast<T*>(c.get())) return p;
        return nullptr;
    }

    template <class T>
    std::vector<T*> GetAll() const
    {
        std::vector<T*> out;
        for (const auto& c : m_components)
            if (auto* p = dynamic_cast<T*>(c.get())) out.push_back(p);
        return out;
    }

    bool Remove(const EntityComponent* component);
    const std::vector<std::shared_ptr<EntityComponent>>& Components() const { return m_components; }

    // ── Hierarchy ───────────────────────────────────────────────────────────
    void AddChild(std::shared_ptr<Entity> child);
    bool RemoveChild(const Entity* child);
    Entity* FindChild(const std::string& name) const;
    Entity* GetParent() const { return m_parent; }
    const std::vector<std::shared_ptr<Entity>>& Children() const { return m_children; }

    // Scene this entity belongs to, through its root ancestor. nullptr when detached.
    Scene* GetScene() const;

    // Detach from the parent or the scene. The entity may be destroyed by this
    // call if nothing else holds a reference to it.
    void RemoveFromScene();

    Matrix  WorldMatrix() const;
    Vector3 WorldPosition() const;

private:
    friend class Scene;

    std::string                                   m_name;
    std::vector<std::shared_ptr<EntityComponent>> m_components;
    std::vector<std::shared_ptr<Entity>>          m_children;
    Entity*                                       m_parent = nullptr;
    Scene*                                        m_scene  = nullptr;
};

} // namespace Kindling
