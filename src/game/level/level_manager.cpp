/// @file level_manager.cpp
/// @brief Level teardown, generation and population.

#include "nexus/game/level_manager.hpp"

#include "nexus/foundation/game_logger.hpp"
#include "nexus/game/maze_generator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace nexus::game {

using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr GridCell kStartCell{1, 1};

constexpr float kGoalSpin = 0.01f;
constexpr float kEnemySpin = 0.005f;
constexpr float kPowerUpSpin = 0.003f;
constexpr float kCollectibleSpin = 0.002f;

} // namespace

// ── Lifecycle ───────────────────────────────────────────────────────────

GameResult<void> LevelManager::CreateLevel() {
    auto& state = world_.state;
    state.SetPhase(GamePhase::Loading);

    teardown();
    world_.particles.Initialize(world_.config.particlePoolSize);

    const int32_t size = world_.config.MazeSizeForLevel(state.Level());
    auto generated = MazeGenerator::Generate(size, size, world_.rng,
                                             world_.config.extraOpeningRatio);
    if (!generated) {
        NEXUS_LOG_ERROR(LogCategory::Level, "Level " + std::to_string(state.Level()) +
                                                " generation failed: " +
                                                generated.error().describe());
        return GameResult<void>::err(generated.error());
    }

    world_.maze = std::move(generated).value();
    world_.mapping.width = size;
    world_.mapping.height = size;
    world_.mapping.cellSize = world_.config.cellSize;
    world_.exploration.Reset(size, size);

    populate(size);

    world_.player.jumpReady = true;
    world_.player.boosting = false;
    world_.player.moveTimer = 0;
    world_.levelStartMs = world_.frame.nowMs;

    state.SetPhase(GamePhase::Playing);
    world_.Emit(GameEventType::LevelCreated, world_.player.entity, {},
                static_cast<float>(state.Level()));

    foundation::LogContext ctx;
    ctx.level = state.Level();
    ctx.extra["size"] = std::to_string(size);
    ctx.extra["entities"] = std::to_string(world_.registry.EntityCount());
    foundation::GameLogger::instance().logWithContext(foundation::LogLevel::Info,
                                                      LogCategory::Level, "Level created", ctx);
    return GameResult<void>::ok();
}

void LevelManager::ScheduleNextLevel() {
    cancelTransition();
    transition_ = world_.scheduled.Schedule(
        world_.frame.nowMs + world_.config.levelTransitionDelayMs, ecs::Entity::invalid(),
        "level-transition", [this] { AdvanceToNextLevel(); });
}

void LevelManager::AdvanceToNextLevel() {
    transition_ = 0;
    if (auto result = CreateLevel(); !result) {
        NEXUS_LOG_ERROR(LogCategory::Level,
                        "Level transition aborted: " + result.error().describe());
        world_.state.SetPhase(GamePhase::Loading);
    }
}

GameResult<void> LevelManager::RestartLevel() {
    cancelTransition();
    auto result = CreateLevel();
    if (!result) {
        return result;
    }
    auto& state = world_.state;
    state.SetScore(std::max<int64_t>(0, state.Score() - world_.config.restartPenalty));
    NEXUS_LOG_INFO(LogCategory::Level, "Level " + std::to_string(state.Level()) + " restarted");
    return result;
}

GameResult<void> LevelManager::RestartGame(int64_t nowMs) {
    cancelTransition();
    world_.scheduled.Clear();
    world_.state.Reset();
    world_.gameStartMs = nowMs;
    NEXUS_LOG_INFO(LogCategory::Level, "New game started");
    return CreateLevel();
}

bool LevelManager::TransitionPending() const noexcept {
    return transition_ != 0 && world_.scheduled.IsPending(transition_);
}

void LevelManager::cancelTransition() {
    if (transition_ != 0) {
        world_.scheduled.Cancel(transition_);
        transition_ = 0;
    }
}

// ── Teardown ────────────────────────────────────────────────────────────

void LevelManager::teardown() {
    auto& registry = world_.registry;

    world_.aiContexts.Clear();
    if (world_.player.entity.isValid()) {
        world_.scheduled.CancelOwner(world_.player.entity);
    }

    const std::vector<ecs::Entity> alive = registry.Entities();
    std::size_t destroyed = 0;
    for (auto entity : alive) {
        if (registry.HasComponent(world_.kinds.particle, entity)) {
            continue;
        }
        registry.DestroyEntity(entity);
        ++destroyed;
    }
    world_.particles.ReleaseAll();
    world_.player.entity = ecs::Entity::invalid();

    NEXUS_LOG_DEBUG(LogCategory::Level,
                    "Teardown destroyed " + std::to_string(destroyed) + " entities");
}

// ── Population ──────────────────────────────────────────────────────────

void LevelManager::populate(int32_t size) {
    spawnPlayer();
    spawnWalls();
    spawnGoal(size);

    const GridCell goalCell{size - 2, size - 2};
    std::vector<GridCell> pool = world_.maze.OpenCells();
    std::erase_if(pool, [&](const GridCell& cell) {
        return cell == kStartCell || cell == goalCell;
    });

    spawnEnemies(pool);
    spawnPowerUps(pool);
    spawnCollectibles(pool, size);
}

bool LevelManager::takeCell(std::vector<GridCell>& pool, GridCell& cell) {
    if (pool.empty()) {
        return false;
    }
    const std::size_t index = RandomIndex(world_.rng, pool.size());
    cell = pool[index];
    pool[index] = pool.back();
    pool.pop_back();
    return true;
}

void LevelManager::spawnPlayer() {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;

    auto player = registry.CreateEntity();
    registry.AddComponent(kinds.player, player);
    auto* position = registry.AddComponent(kinds.position, player);
    position->Assign(world_.mapping.GridToWorld(kStartCell, world_.config.playerSpawnHeight));
    registry.AddComponent(kinds.velocity, player);
    world_.player.entity = player;

    auto trail = registry.CreateEntity();
    registry.AddComponent(kinds.trail, trail);
    registry.AddComponent(kinds.trailPoints, trail);
}

void LevelManager::spawnWalls() {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const auto& maze = world_.maze;
    const float half = world_.mapping.HalfCell();

    for (int32_t z = 0; z < maze.Height(); ++z) {
        for (int32_t x = 0; x < maze.Width(); ++x) {
            const GridCell cell{x, z};
            if (!maze.IsWall(cell)) {
                continue;
            }
            auto wall = registry.CreateEntity();
            auto* position = registry.AddComponent(kinds.position, wall);
            position->Assign(world_.mapping.GridToWorld(cell, world_.config.wallHeight * 0.5f));
            registry.AddComponent(kinds.wall, wall, Wall{half});
        }
    }
}

void LevelManager::spawnGoal(int32_t size) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;

    auto goal = registry.CreateEntity();
    registry.AddComponent(kinds.goal, goal);
    auto* position = registry.AddComponent(kinds.position, goal);
    position->Assign(world_.mapping.GridToWorld({size - 2, size - 2}, 1.0f));
    registry.AddComponent(kinds.animation, goal, Animation{kGoalSpin, 0.0f, 0.0f});
}

void LevelManager::spawnEnemies(std::vector<GridCell>& pool) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const auto& config = world_.config;

    const auto count = static_cast<int32_t>(
        std::floor(static_cast<float>(world_.state.Level()) * config.enemyPerLevel + config.enemyBase));

    int32_t spawned = 0;
    for (int32_t i = 0; i < count; ++i) {
        GridCell cell;
        if (!takeCell(pool, cell)) {
            continue;
        }
        if (std::abs(cell.x - kStartCell.x) < config.spawnExclusionCells &&
            std::abs(cell.z - kStartCell.z) < config.spawnExclusionCells) {
            continue;
        }

        const bool chaser = RandomUnit(world_.rng) >= 1.0f - config.chaserRatio;
        const Enemy enemy{chaser ? EnemyType::Chaser : EnemyType::Patrol,
                          chaser ? config.chaserSpeed : config.patrolSpeed};

        auto entity = registry.CreateEntity();
        auto* position = registry.AddComponent(kinds.position, entity);
        position->Assign(world_.mapping.GridToWorld(cell, config.enemyBobHeight));
        registry.AddComponent(kinds.velocity, entity);
        registry.AddComponent(kinds.enemy, entity, enemy);
        registry.AddComponent(kinds.ai, entity);
        registry.AddComponent(kinds.animation, entity,
                              Animation{kEnemySpin, static_cast<float>(i), 0.0f});
        ++spawned;
    }

    NEXUS_LOG_DEBUG(LogCategory::Level, "Spawned " + std::to_string(spawned) + " of " +
                                            std::to_string(count) + " enemies");
}

void LevelManager::spawnPowerUps(std::vector<GridCell>& pool) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;
    const auto& config = world_.config;

    const auto count = static_cast<int32_t>(std::floor(
        static_cast<float>(world_.state.Level()) * config.powerUpPerLevel + config.powerUpBase));

    for (int32_t i = 0; i < count; ++i) {
        GridCell cell;
        if (!takeCell(pool, cell)) {
            break;
        }
        const auto type = static_cast<PowerUpType>(RandomIndex(world_.rng, kPowerUpTypeCount));

        auto entity = registry.CreateEntity();
        auto* position = registry.AddComponent(kinds.position, entity);
        position->Assign(world_.mapping.GridToWorld(cell, config.powerUpSpawnHeight));
        registry.AddComponent(kinds.powerUp, entity, PowerUp{type});
        registry.AddComponent(kinds.animation, entity,
                              Animation{kPowerUpSpin, static_cast<float>(i), 0.0f});
    }
}

void LevelManager::spawnCollectibles(std::vector<GridCell>& pool, int32_t size) {
    auto& registry = world_.registry;
    const auto& kinds = world_.kinds;

    const auto count = static_cast<int32_t>(
        std::floor(static_cast<float>(size) * world_.config.collectibleFactor));

    for (int32_t i = 0; i < count; ++i) {
        GridCell cell;
        if (!takeCell(pool, cell)) {
            break;
        }
        auto entity = registry.CreateEntity();
        auto* position = registry.AddComponent(kinds.position, entity);
        position->Assign(world_.mapping.GridToWorld(cell, 1.0f));
        registry.AddComponent(kinds.collectible, entity);
        registry.AddComponent(kinds.animation, entity,
                              Animation{kCollectibleSpin, static_cast<float>(i), 0.0f});
    }
}

} // namespace nexus::game
