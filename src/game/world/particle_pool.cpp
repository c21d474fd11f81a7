/// @file particle_pool.cpp
/// @brief ParticlePool implementation.

#include "nexus/game/particle_pool.hpp"

#include "nexus/foundation/game_logger.hpp"

#include <algorithm>
#include <string>

namespace nexus::game {

ParticlePool::ParticlePool(ecs::Registry& registry, const ComponentKinds& kinds,
                           const GameConfig& config, RandomEngine& rng)
    : registry_(registry), kinds_(kinds), config_(config), rng_(rng) {}

void ParticlePool::Initialize(uint32_t capacity) {
    if (!all_.empty()) {
        return;
    }
    all_.reserve(capacity);
    free_.reserve(capacity);
    for (uint32_t i = 0; i < capacity; ++i) {
        auto entity = registry_.CreateEntity();
        registry_.AddComponent(kinds_.particle, entity, Particle{false, 0, 0, palette::kWhite});
        registry_.AddComponent(kinds_.position, entity);
        registry_.AddComponent(kinds_.velocity, entity);
        all_.push_back(entity);
        free_.push_back(entity);
    }
    NEXUS_LOG_DEBUG(foundation::LogCategory::ECS,
                    "Particle pool initialized with " + std::to_string(capacity) + " entities");
}

foundation::GameResult<ecs::Entity> ParticlePool::Spawn(const Vector3& position,
                                                        const Vector3& velocity, int32_t life,
                                                        uint32_t color) {
    using foundation::ErrorCode;
    using foundation::GameError;
    using foundation::GameResult;

    if (free_.empty()) {
        return GameResult<ecs::Entity>::err(
            GameError(ErrorCode::ResourceExhausted, "particle pool exhausted"));
    }
    auto entity = free_.back();
    free_.pop_back();

    auto* particle = registry_.Find(kinds_.particle, entity);
    auto* pos = registry_.Find(kinds_.position, entity);
    auto* vel = registry_.Find(kinds_.velocity, entity);
    if (particle == nullptr || pos == nullptr || vel == nullptr) {
        std::erase(all_, entity);
        return GameResult<ecs::Entity>::err(GameError(
            ErrorCode::StaleReference,
            "pooled particle " + std::to_string(entity.id()) + " no longer exists", entity));
    }
    particle->active = true;
    particle->life = std::max(life, 1);
    particle->maxLife = particle->life;
    particle->color = color;
    pos->Assign(position);
    vel->Assign(velocity);
    return GameResult<ecs::Entity>::ok(entity);
}

std::size_t ParticlePool::Burst(const Vector3& origin, uint32_t color, std::size_t count) {
    const float half = config_.particleBurstSpeed * 0.5f;
    std::size_t spawned = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const Vector3 velocity{RandomRange(rng_, -half, half), RandomRange(rng_, -half, half),
                               RandomRange(rng_, -half, half)};
        const auto life = config_.particleBaseLife +
            static_cast<int32_t>(RandomUnit(rng_) * static_cast<float>(config_.particleLifeVariance));
        if (auto particle = Spawn(origin, velocity, life, color); !particle) {
            NEXUS_LOG_TRACE(foundation::LogCategory::Gameplay,
                            "Burst cut short: " + particle.error().describe());
            break;
        }
        ++spawned;
    }
    return spawned;
}

void ParticlePool::Release(ecs::Entity particle) {
    auto* data = registry_.Find(kinds_.particle, particle);
    if (data == nullptr || !data->active) {
        return;
    }
    data->active = false;
    data->life = 0;
    if (auto* vel = registry_.Find(kinds_.velocity, particle)) {
        vel->Assign(Vector3::Zero());
    }
    free_.push_back(particle);
}

void ParticlePool::ReleaseAll() {
    for (auto entity : all_) {
        Release(entity);
    }
}

} // namespace nexus::game
