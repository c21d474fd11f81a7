/// @file collision_system.cpp
/// @brief CollisionSystem implementation.

#include "nexus/game/collision_system.hpp"

#include "nexus/foundation/game_logger.hpp"
#include "nexus/game/level_manager.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace nexus::game {

using foundation::LogCategory;

namespace {
constexpr float kContactSlop = 1e-5f;
}  // namespace

void CollisionSystem::Execute(float /*deltaTime*/) {
    auto* position = world_.PlayerPosition();
    auto* velocity = world_.PlayerVelocity();
    if (position == nullptr || velocity == nullptr) {
        return;
    }

    resolveWalls(*position, *velocity);
    collectPickups(*position);
    if (!resolveEnemyContact(*position, *velocity)) {
        return;
    }
    separateEnemies();
    checkGoal(*position);
}

// ── Walls ───────────────────────────────────────────────────────────────

void CollisionSystem::resolveWalls(Position& position, Velocity& velocity) {
    // A push out of one wall can land inside a neighbour processed earlier,
    // so the neighbourhood is rescanned until a pass makes no correction.
    for (int pass = 0; pass < kMaxWallPasses; ++pass) {
        const GridCell centre = world_.mapping.WorldToGrid(position.ToVector());
        bool corrected = false;
        for (int32_t dz = -1; dz <= 1; ++dz) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                const GridCell cell{centre.x + dx, centre.z + dz};
                if (world_.maze.InBounds(cell) && world_.maze.IsWall(cell)) {
                    corrected = pushOutOfWall(cell, position, velocity) || corrected;
                }
            }
        }
        if (!corrected) {
            return;
        }
    }
}

bool CollisionSystem::pushOutOfWall(GridCell cell, Position& position, Velocity& velocity) {
    const auto& config = world_.config;
    const float radius = config.playerRadius;
    const float half = world_.mapping.HalfCell();
    const Vector3 wall = world_.mapping.GridToWorld(cell);
    const float minX = wall.x - half;
    const float maxX = wall.x + half;
    const float minZ = wall.z - half;
    const float maxZ = wall.z + half;

    const float closestX = std::clamp(position.x, minX, maxX);
    const float closestZ = std::clamp(position.z, minZ, maxZ);
    const float offX = position.x - closestX;
    const float offZ = position.z - closestZ;
    const float distSq = offX * offX + offZ * offZ;
    // Resting exactly on the face is contact-free.
    if (distSq >= radius * radius - kContactSlop) {
        return false;
    }

    Vector3 normal;
    if (distSq > 1e-12f) {
        const float dist = std::sqrt(distSq);
        normal = {offX / dist, 0.0f, offZ / dist};
        position.x += normal.x * (radius - dist);
        position.z += normal.z * (radius - dist);
    } else {
        // Centre inside the square: leave along the shallowest face that
        // opens onto a free cell; a fully enclosed cell uses any face.
        struct Face {
            float depth;
            GridCell beyond;
            Vector3 normal;
        };
        const std::array<Face, 4> faces = {{
            {position.x - minX, {cell.x - 1, cell.z}, {-1.0f, 0.0f, 0.0f}},
            {maxX - position.x, {cell.x + 1, cell.z}, {1.0f, 0.0f, 0.0f}},
            {position.z - minZ, {cell.x, cell.z - 1}, {0.0f, 0.0f, -1.0f}},
            {maxZ - position.z, {cell.x, cell.z + 1}, {0.0f, 0.0f, 1.0f}},
        }};
        const Face* exit = nullptr;
        const Face* fallback = &faces[0];
        for (const auto& face : faces) {
            if (face.depth < fallback->depth) {
                fallback = &face;
            }
            if (world_.maze.IsOpen(face.beyond) && (exit == nullptr || face.depth < exit->depth)) {
                exit = &face;
            }
        }
        if (exit == nullptr) {
            exit = fallback;
        }
        normal = exit->normal;
        if (normal.x < 0.0f) {
            position.x = minX - radius;
        } else if (normal.x > 0.0f) {
            position.x = maxX + radius;
        } else if (normal.z < 0.0f) {
            position.z = minZ - radius;
        } else {
            position.z = maxZ + radius;
        }
    }

    const float into = velocity.ToVector().Dot(normal);
    if (into < 0.0f) {
        const float bounce = (1.0f + config.wallRestitution) * into;
        velocity.x -= bounce * normal.x;
        velocity.z -= bounce * normal.z;
    }

    if (velocity.ToVector().HorizontalLength() > config.sparkSpeedThreshold) {
        world_.particles.Burst({closestX, position.y, closestZ}, palette::kSpark, 1);
        if (RandomUnit(world_.rng) < config.scrapeChance) {
            world_.Emit(GameEventType::Scrape, world_.player.entity,
                        {closestX, position.y, closestZ});
        }
    }
    return true;
}

// ── Pickups ─────────────────────────────────────────────────────────────

void CollisionSystem::collectPickups(const Position& position) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const auto& config = world_.config;
    auto& state = world_.state;
    const Vector3 player = position.ToVector();

    for (auto entity : registry.Snapshot(world_.queries.collectibles)) {
        const auto* item = registry.Find(kinds.position, entity);
        if (item == nullptr || HorizontalDistance(player, item->ToVector()) >= config.collectibleRadius) {
            continue;
        }
        const Vector3 at = item->ToVector();
        state.AddScore(config.collectibleScore * static_cast<int64_t>(state.Level()),
                       world_.PlayerMultiplier());
        state.SetEnergy(state.Energy() + config.collectibleEnergy);
        world_.Emit(GameEventType::Collect, entity, at);
        world_.particles.Burst(at, palette::kAccent, 5);
        registry.DestroyEntity(entity);
    }

    for (auto entity : registry.Snapshot(world_.queries.powerUps)) {
        const auto* item = registry.Find(kinds.position, entity);
        const auto* powerUp = registry.Find(kinds.powerUp, entity);
        if (item == nullptr || powerUp == nullptr ||
            HorizontalDistance(player, item->ToVector()) >= config.powerUpRadius) {
            continue;
        }
        const Vector3 at = item->ToVector();
        const PowerUpType type = powerUp->type;
        applyPowerUp(type);

        foundation::LogContext ctx;
        ctx.entityId = entity.id();
        ctx.level = state.Level();
        ctx.extra["type"] = std::string(powerUpName(type));
        foundation::GameLogger::instance().logWithContext(
            foundation::LogLevel::Debug, LogCategory::Gameplay, "Power-up collected", ctx);

        world_.Emit(GameEventType::PowerUp, entity, at);
        world_.RequestScreenShake(8.0f);
        world_.particles.Burst(at, palette::kWhite, 12);
        registry.DestroyEntity(entity);
    }
}

void CollisionSystem::applyPowerUp(PowerUpType type) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const auto& config = world_.config;
    const auto player = world_.player.entity;

    switch (type) {
        case PowerUpType::Speed:
            registry.AddComponent(kinds.speedBoost, player);
            world_.AddEffectTimer(player, kinds.speedBoost.id, config.speedDurationMs);
            break;
        case PowerUpType::Shield:
            registry.AddComponent(kinds.shield, player);
            world_.AddEffectTimer(player, kinds.shield.id, config.shieldDurationMs);
            break;
        case PowerUpType::Multiplier:
            registry.AddComponent(kinds.scoreMultiplier, player,
                                  ScoreMultiplier{config.multiplierValue});
            world_.AddEffectTimer(player, kinds.scoreMultiplier.id, config.multiplierDurationMs);
            break;
        case PowerUpType::Energy:
            world_.state.SetEnergy(world_.state.MaxEnergy());
            break;
    }
}

// ── Enemies ─────────────────────────────────────────────────────────────

bool CollisionSystem::resolveEnemyContact(Position& position, Velocity& velocity) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const auto& config = world_.config;
    auto& state = world_.state;
    const auto player = world_.player.entity;

    if (registry.HasComponent(kinds.shield, player)) {
        return true;
    }

    for (auto entity : registry.Resolve(world_.queries.enemies)) {
        const auto* enemyPosition = registry.Find(kinds.position, entity);
        auto* enemyVelocity = registry.Find(kinds.velocity, entity);
        if (enemyPosition == nullptr || enemyVelocity == nullptr) {
            continue;
        }
        float dist = HorizontalDistance(position.ToVector(), enemyPosition->ToVector());
        if (dist >= config.enemyContactRadius) {
            continue;
        }

        state.SetHealth(state.Health() - config.enemyDamage);
        world_.Emit(GameEventType::Damage, entity, position.ToVector(),
                    static_cast<float>(config.enemyDamage));
        world_.RequestScreenShake(15.0f);
        world_.particles.Burst(position.ToVector(), palette::kDanger, 8);

        if (dist <= 0.0f) {
            dist = 1.0f;
        }
        const float nx = (position.x - enemyPosition->x) / dist;
        const float nz = (position.z - enemyPosition->z) / dist;
        velocity.x += nx * config.knockbackForce;
        velocity.z += nz * config.knockbackForce;
        enemyVelocity->x -= nx * config.knockbackForce * 0.5f;
        enemyVelocity->z -= nz * config.knockbackForce * 0.5f;

        foundation::LogContext ctx;
        ctx.entityId = entity.id();
        ctx.level = state.Level();
        ctx.extra["health"] = std::to_string(state.Health());
        foundation::GameLogger::instance().logWithContext(
            foundation::LogLevel::Debug, LogCategory::Gameplay, "Player damaged", ctx);

        if (state.Health() <= 0) {
            state.SetPhase(GamePhase::GameOver);
            world_.Emit(GameEventType::GameOver, player, position.ToVector());
            NEXUS_LOG_INFO(LogCategory::Gameplay,
                           "Game over at level " + std::to_string(state.Level()) +
                               " with score " + std::to_string(state.Score()));
            return false;
        }

        registry.AddComponent(kinds.shield, player);
        world_.AddEffectTimer(player, kinds.shield.id, config.damageShieldDurationMs);
        break;
    }
    return true;
}

void CollisionSystem::separateEnemies() {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const float radius = world_.config.enemySeparationRadius;
    const auto& enemies = registry.Resolve(world_.queries.enemies);

    for (std::size_t i = 0; i < enemies.size(); ++i) {
        auto* a = registry.Find(kinds.position, enemies[i]);
        for (std::size_t j = i + 1; j < enemies.size(); ++j) {
            auto* b = registry.Find(kinds.position, enemies[j]);
            if (a == nullptr || b == nullptr) {
                continue;
            }
            const float dx = a->x - b->x;
            const float dz = a->z - b->z;
            const float distSq = dx * dx + dz * dz;
            if (distSq >= radius * radius || distSq <= 0.0f) {
                continue;
            }
            const float dist = std::sqrt(distSq);
            const float push = (radius - dist) * 0.5f / dist;
            a->x += dx * push;
            a->z += dz * push;
            b->x -= dx * push;
            b->z -= dz * push;
        }
    }
}

// ── Goal ────────────────────────────────────────────────────────────────

void CollisionSystem::checkGoal(const Position& position) {
    auto& registry = world_.registry;
    const auto& config = world_.config;
    auto& state = world_.state;

    if (state.Phase() != GamePhase::Playing) {
        return;
    }

    for (auto entity : registry.Resolve(world_.queries.goals)) {
        const auto* goal = registry.Find(world_.kinds.position, entity);
        if (goal == nullptr ||
            HorizontalDistance(position.ToVector(), goal->ToVector()) >= config.goalRadius) {
            continue;
        }

        state.AddScore(config.goalScore * static_cast<int64_t>(state.Level()),
                       world_.PlayerMultiplier());
        const uint32_t reached = state.Level() + 1;
        state.SetLevel(reached);
        state.SetHealth(state.Health() + config.levelUpHeal);

        if (reached >= config.victoryLevel) {
            state.SetPhase(GamePhase::GameWon);
            world_.Emit(GameEventType::GameWon, world_.player.entity, position.ToVector());
            NEXUS_LOG_INFO(LogCategory::Gameplay,
                           "Game won with score " + std::to_string(state.Score()));
            return;
        }

        state.SetPhase(GamePhase::Transitioning);
        world_.Emit(GameEventType::LevelUp, world_.player.entity, position.ToVector(),
                    static_cast<float>(reached));
        world_.RequestScreenShake(12.0f);
        levels_.ScheduleNextLevel();
        NEXUS_LOG_INFO(LogCategory::Gameplay, "Goal reached, advancing to level " +
                                                   std::to_string(reached));
        return;
    }
}

} // namespace nexus::game
