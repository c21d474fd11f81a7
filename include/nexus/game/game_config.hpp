#pragma once

/// @file game_config.hpp
/// @brief Tunable constants of the maze simulation.
///
/// Defaults reproduce the shipped game; any field can be overridden from
/// YAML through LoadGameConfig().

#include <cstddef>
#include <cstdint>

#include "nexus/foundation/config_manager.hpp"
#include "nexus/foundation/game_result.hpp"

namespace nexus::game {

struct GameConfig {
    // Maze
    int32_t initialMazeSize = 31;
    int32_t mazeSizeGrowth = 4;   ///< added every two levels
    int32_t maxMazeSize = 71;
    float cellSize = 2.5f;
    float wallHeight = 3.0f;
    double extraOpeningRatio = 0.003;

    // Player
    float playerRadius = 0.5f;
    float playerSpawnHeight = 1.2f;
    float playerForce = 40.0f;
    float jumpForce = 30.0f;
    float jumpCost = 25.0f;
    int64_t jumpCooldownMs = 1500;
    float boostMultiplier = 2.5f;
    float speedBoostMultiplier = 1.5f;
    float energyRegen = 0.2f;       ///< per frame
    float energyBoostCost = 0.5f;   ///< per frame
    float maxEnergy = 100.0f;
    int32_t maxHealth = 100;

    // Physics
    float wallRestitution = 0.4f;
    float friction = 0.96f;
    float sparkSpeedThreshold = 2.0f;
    float scrapeChance = 0.2f;

    // Pickups
    float collectibleRadius = 1.0f;
    float powerUpRadius = 1.2f;
    float powerUpSpawnHeight = 1.5f;
    float goalRadius = 2.0f;
    int64_t collectibleScore = 25;   ///< times level times multiplier
    float collectibleEnergy = 10.0f;
    int64_t goalScore = 200;         ///< times level times multiplier

    // Particles
    uint32_t particlePoolSize = 300;
    int32_t particleBaseLife = 20;
    int32_t particleLifeVariance = 20;
    float particleGravity = 0.008f;
    float particleBurstSpeed = 3.0f;

    // Enemies
    float enemyContactRadius = 1.0f;
    int32_t enemyDamage = 20;
    float knockbackForce = 15.0f;
    float enemySeparationRadius = 1.0f;
    float chaserSpeed = 2.0f;
    float patrolSpeed = 1.5f;
    float chaserSpeedMultiplier = 1.5f;
    float aiChaseRadius = 10.0f;
    float aiPatrolRadius = 15.0f;
    uint32_t aiRepathInterval = 30;
    float waypointReachDistance = 1.0f;
    int32_t spawnExclusionCells = 5;

    // Effects
    int64_t shieldDurationMs = 8000;
    int64_t speedDurationMs = 10000;
    int64_t multiplierDurationMs = 15000;
    int32_t multiplierValue = 3;
    int64_t damageShieldDurationMs = 2000;

    // Progression
    int32_t levelUpHeal = 25;
    uint32_t victoryLevel = 20;
    int64_t levelTransitionDelayMs = 2000;
    int64_t restartPenalty = 50;

    // Population densities
    float enemyBase = 2.0f;
    float enemyPerLevel = 1.5f;
    float powerUpBase = 1.0f;
    float powerUpPerLevel = 0.8f;
    float collectibleFactor = 1.2f;
    float chaserRatio = 0.3f;

    // Presentation cues
    uint32_t moveCueInterval = 12;
    int32_t fogRadius = 2;
    std::size_t trailLength = 60;
    float collectibleBobHeight = 1.5f;
    float bobAmplitude = 0.4f;
    float enemyBobHeight = 1.0f;
    float enemyBobAmplitude = 0.1f;

    // Frame
    float maxFrameDelta = 0.05f;

    /// Maze side length for @p level (always odd when the config is valid).
    [[nodiscard]] int32_t MazeSizeForLevel(uint32_t level) const noexcept;
};

/// Check internal consistency (odd sizes, positive radii, hysteresis).
foundation::GameResult<void> ValidateGameConfig(const GameConfig& config);

/// Overlay present keys of @p source (e.g. "maze.initial_size") on the
/// defaults, then validate.
foundation::GameResult<GameConfig> LoadGameConfig(const foundation::ConfigManager& source);

} // namespace nexus::game
