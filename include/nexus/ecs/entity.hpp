#pragma once

/// @file entity.hpp
/// @brief Entity type for the ECS layer.
///
/// An entity is an opaque 32-bit identifier. Identifiers are issued
/// monotonically by EntityManager and never reused, so a handle to a
/// destroyed entity can never alias a newer one.

#include <cstdint>
#include <functional>
#include <limits>

namespace nexus::ecs {

/// Opaque entity handle.
struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kInvalidRaw - 1;

    /// Default-construct to the invalid sentinel.
    constexpr Entity() = default;

    constexpr explicit Entity(uint32_t id) : raw(id) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw; }

    /// True for any handle other than the invalid sentinel. Says nothing
    /// about whether the entity is still alive.
    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace nexus::ecs

template <>
struct std::hash<nexus::ecs::Entity> {
    std::size_t operator()(const nexus::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
