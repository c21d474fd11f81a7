#pragma once

/// @file registry.hpp
/// @brief Entity/component store with incrementally maintained queries.
///
/// The Registry owns every component storage and every query cache.
/// Adding, removing or destroying keeps each affected query exact, so a
/// query lookup is O(1) and always equals a brute-force filter over the
/// live entities.

#include "nexus/ecs/component_kind.hpp"
#include "nexus/ecs/component_storage.hpp"
#include "nexus/ecs/entity.hpp"
#include "nexus/ecs/entity_manager.hpp"
#include "nexus/ecs/query.hpp"
#include "nexus/foundation/game_result.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nexus::ecs {

class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) noexcept = default;
    Registry& operator=(Registry&&) noexcept = default;

    // ── Entities ─────────────────────────────────────────────────────

    [[nodiscard]] Entity CreateEntity() { return entities_.Create(); }

    /// Remove @p entity, all of its components and all query memberships.
    /// No-op for an entity that does not exist.
    void DestroyEntity(Entity entity);

    [[nodiscard]] bool EntityExists(Entity entity) const noexcept {
        return entities_.IsAlive(entity);
    }

    [[nodiscard]] std::size_t EntityCount() const noexcept { return entities_.Count(); }

    [[nodiscard]] const std::vector<Entity>& Entities() const noexcept {
        return entities_.Alive();
    }

    // ── Component kinds ──────────────────────────────────────────────

    /// Create a storage for T and return its handle. Each call defines a
    /// distinct kind, even for the same T.
    template <typename T>
    ComponentKind<T> DefineComponentKind();

    [[nodiscard]] std::size_t ComponentKindCount() const noexcept { return storages_.size(); }

    // ── Components ───────────────────────────────────────────────────

    /// Attach (or overwrite) @p value on @p entity.
    /// @return The stored component, or nullptr when the entity is dead.
    template <typename T>
    T* AddComponent(ComponentKind<T> kind, Entity entity, T value = T{});

    template <typename T>
    void RemoveComponent(ComponentKind<T> kind, Entity entity) {
        RemoveComponent(kind.id, entity);
    }

    /// Untyped removal, used where the kind is carried as data.
    void RemoveComponent(ComponentKindId kind, Entity entity);

    template <typename T>
    [[nodiscard]] bool HasComponent(ComponentKind<T> kind, Entity entity) const {
        return HasComponent(kind.id, entity);
    }

    [[nodiscard]] bool HasComponent(ComponentKindId kind, Entity entity) const;

    /// Hot-path lookup: the component or nullptr.
    template <typename T>
    [[nodiscard]] T* Find(ComponentKind<T> kind, Entity entity);

    template <typename T>
    [[nodiscard]] const T* Find(ComponentKind<T> kind, Entity entity) const;

    /// Checked lookup reporting EntityNotFound or ComponentNotFound.
    template <typename T>
    [[nodiscard]] foundation::GameResult<T*> GetComponent(ComponentKind<T> kind, Entity entity);

    /// Direct access to a kind's storage.
    template <typename T>
    [[nodiscard]] const ComponentStorage<T>& Storage(ComponentKind<T> kind) const;

    // ── Queries ──────────────────────────────────────────────────────

    /// Register a cached query over the given kinds. Identical predicates
    /// (regardless of order or repetition) share one handle.
    template <typename... Ts>
    QueryHandle DefineQuery(ComponentKind<Ts>... kinds) {
        return DefineQuery(std::vector<ComponentKindId>{kinds.id...});
    }

    /// Untyped form. Returns an invalid handle if any kind is unknown or
    /// the list is empty.
    QueryHandle DefineQuery(std::vector<ComponentKindId> kinds);

    /// Current members of @p query, O(1). The reference is invalidated by
    /// any structural change; use Snapshot() when mutating while iterating.
    [[nodiscard]] const std::vector<Entity>& Resolve(QueryHandle query) const;

    /// Copy of the current members of @p query.
    [[nodiscard]] std::vector<Entity> Snapshot(QueryHandle query) const {
        return Resolve(query);
    }

    [[nodiscard]] std::size_t QueryCount() const noexcept { return queries_.size(); }

private:
    void onComponentAdded(ComponentKindId kind, Entity entity);
    void onComponentRemoved(ComponentKindId kind, Entity entity);

    template <typename T>
    ComponentStorage<T>& storage(ComponentKind<T> kind) {
        return static_cast<ComponentStorage<T>&>(*storages_[kind.id]);
    }

    template <typename T>
    const ComponentStorage<T>& storage(ComponentKind<T> kind) const {
        return static_cast<const ComponentStorage<T>&>(*storages_[kind.id]);
    }

    [[nodiscard]] bool knownKind(ComponentKindId kind) const noexcept {
        return kind < storages_.size();
    }

    EntityManager entities_;
    std::vector<std::unique_ptr<IComponentStorage>> storages_;
    std::vector<QueryCache> queries_;
    std::map<std::vector<ComponentKindId>, uint32_t> queryIndex_;
    std::vector<std::vector<uint32_t>> kindToQueries_;  ///< kind -> dependent queries
};

// ── Template implementations ────────────────────────────────────────────

template <typename T>
ComponentKind<T> Registry::DefineComponentKind() {
    const auto id = static_cast<ComponentKindId>(storages_.size());
    storages_.push_back(std::make_unique<ComponentStorage<T>>());
    kindToQueries_.emplace_back();
    return ComponentKind<T>{id};
}

template <typename T>
T* Registry::AddComponent(ComponentKind<T> kind, Entity entity, T value) {
    if (!knownKind(kind.id) || !entities_.IsAlive(entity)) {
        return nullptr;
    }
    auto& pool = storage(kind);
    const bool existed = pool.Has(entity);
    T& stored = pool.Emplace(entity, std::move(value));
    if (!existed) {
        onComponentAdded(kind.id, entity);
    }
    return &stored;
}

template <typename T>
T* Registry::Find(ComponentKind<T> kind, Entity entity) {
    if (!knownKind(kind.id)) {
        return nullptr;
    }
    return storage(kind).TryGet(entity);
}

template <typename T>
const T* Registry::Find(ComponentKind<T> kind, Entity entity) const {
    if (!knownKind(kind.id)) {
        return nullptr;
    }
    return storage(kind).TryGet(entity);
}

template <typename T>
foundation::GameResult<T*> Registry::GetComponent(ComponentKind<T> kind, Entity entity) {
    using foundation::ErrorCode;
    using foundation::GameError;
    if (!entities_.IsAlive(entity)) {
        return foundation::GameResult<T*>::err(GameError(
            ErrorCode::EntityNotFound, "entity " + std::to_string(entity.id()) + " does not exist"));
    }
    if (auto* component = Find(kind, entity)) {
        return foundation::GameResult<T*>::ok(component);
    }
    return foundation::GameResult<T*>::err(GameError(
        ErrorCode::ComponentNotFound,
        "entity " + std::to_string(entity.id()) + " has no component of kind " +
            std::to_string(kind.id)));
}

template <typename T>
const ComponentStorage<T>& Registry::Storage(ComponentKind<T> kind) const {
    return storage(kind);
}

}  // namespace nexus::ecs
