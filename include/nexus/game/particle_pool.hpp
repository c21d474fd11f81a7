#pragma once

/// @file particle_pool.hpp
/// @brief Fixed pool of pre-allocated particle entities.

#include <cstdint>
#include <vector>

#include "nexus/ecs/registry.hpp"
#include "nexus/foundation/game_result.hpp"
#include "nexus/game/game_config.hpp"
#include "nexus/game/random.hpp"
#include "nexus/game/world_schema.hpp"

namespace nexus::game {

/// Particle entities are created once and recycled: spawning takes an
/// inactive one from the free list, and the particle system gives it back
/// when its life runs out. An empty pool drops spawns silently.
class ParticlePool {
public:
    ParticlePool(ecs::Registry& registry, const ComponentKinds& kinds, const GameConfig& config,
                 RandomEngine& rng);

    ParticlePool(const ParticlePool&) = delete;
    ParticlePool& operator=(const ParticlePool&) = delete;

    /// Create @p capacity inactive particles. Calling again is a no-op.
    void Initialize(uint32_t capacity);

    /// Activate one particle and return it. Fails with ResourceExhausted
    /// when no particle is free, or StaleReference when the pooled entity
    /// was destroyed outside the pool (it is then forgotten).
    foundation::GameResult<ecs::Entity> Spawn(const Vector3& position, const Vector3& velocity,
                                              int32_t life, uint32_t color);

    /// Spawn up to @p count particles with random velocities and lives.
    /// @return Number actually spawned.
    std::size_t Burst(const Vector3& origin, uint32_t color, std::size_t count);

    /// Deactivate @p particle and return it to the free list.
    void Release(ecs::Entity particle);

    /// Deactivate every active particle (level teardown).
    void ReleaseAll();

    [[nodiscard]] std::size_t Available() const noexcept { return free_.size(); }
    [[nodiscard]] std::size_t Capacity() const noexcept { return all_.size(); }

private:
    ecs::Registry& registry_;
    const ComponentKinds& kinds_;
    const GameConfig& config_;
    RandomEngine& rng_;

    std::vector<ecs::Entity> all_;
    std::vector<ecs::Entity> free_;
};

} // namespace nexus::game
