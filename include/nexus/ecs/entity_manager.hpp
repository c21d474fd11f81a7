#pragma once

/// @file entity_manager.hpp
/// @brief Entity identifier issuance and alive-set bookkeeping.

#include "nexus/ecs/entity.hpp"

#include <cstdint>
#include <vector>

namespace nexus::ecs {

/// Issues entity identifiers and tracks which ones are alive.
///
/// Identifiers grow monotonically and are never recycled. The alive set
/// is a sparse set so that membership tests, removal and iteration over
/// live entities are all O(1) per element.
class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Issue a fresh, never-before-seen identifier.
    [[nodiscard]] Entity Create();

    /// Mark @p entity dead. Returns false if it was not alive.
    bool Destroy(Entity entity);

    // ── Queries ──────────────────────────────────────────────────────

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept { return alive_.size(); }

    /// Number of identifiers issued so far, dead ones included.
    [[nodiscard]] std::size_t Issued() const noexcept { return nextId_; }

    /// Live entities in unspecified order.
    [[nodiscard]] const std::vector<Entity>& Alive() const noexcept { return alive_; }

private:
    static constexpr uint32_t kNotAlive = static_cast<uint32_t>(-1);

    uint32_t nextId_ = 0;
    std::vector<Entity> alive_;      ///< dense list of live entities
    std::vector<uint32_t> position_; ///< entity id -> index in alive_
};

}  // namespace nexus::ecs
