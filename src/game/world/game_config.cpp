/// @file game_config.cpp
/// @brief YAML overlay and validation for GameConfig.

#include "nexus/game/game_config.hpp"

#include <algorithm>
#include <string>

namespace nexus::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameResult<void> invalid(std::string message) {
    return GameResult<void>::err(GameError(ErrorCode::InvalidConfiguration, std::move(message)));
}

/// Copy @p key into @p field when present. A present key of the wrong
/// type is an error; an absent key keeps the default.
template <typename T>
GameResult<void> overlay(const ConfigManager& source, const char* key, T& field) {
    if (!source.hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = source.get<T>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    field = value.value();
    return GameResult<void>::ok();
}

} // namespace

int32_t GameConfig::MazeSizeForLevel(uint32_t level) const noexcept {
    const auto grown = initialMazeSize + static_cast<int32_t>(level / 2) * mazeSizeGrowth;
    return std::min(grown, maxMazeSize);
}

GameResult<void> ValidateGameConfig(const GameConfig& config) {
    if (config.initialMazeSize < 5 || config.initialMazeSize % 2 == 0) {
        return invalid("maze.initial_size must be odd and at least 5");
    }
    if (config.maxMazeSize < config.initialMazeSize || config.maxMazeSize % 2 == 0) {
        return invalid("maze.max_size must be odd and not below maze.initial_size");
    }
    if (config.mazeSizeGrowth < 0 || config.mazeSizeGrowth % 2 != 0) {
        return invalid("maze.growth must be a non-negative even number");
    }
    if (config.cellSize <= 0.0f) {
        return invalid("maze.cell_size must be positive");
    }
    if (config.extraOpeningRatio < 0.0 || config.extraOpeningRatio > 1.0) {
        return invalid("maze.extra_opening_ratio must lie in [0, 1]");
    }
    if (config.playerRadius <= 0.0f || config.playerRadius * 2.0f >= config.cellSize) {
        return invalid("player.radius must be positive and narrower than a cell");
    }
    if (config.aiChaseRadius <= 0.0f || config.aiPatrolRadius <= config.aiChaseRadius) {
        return invalid("ai.patrol_radius must be greater than ai.chase_radius");
    }
    if (config.aiRepathInterval == 0) {
        return invalid("ai.repath_interval must be positive");
    }
    if (config.friction <= 0.0f || config.friction > 1.0f) {
        return invalid("physics.friction must lie in (0, 1]");
    }
    if (config.victoryLevel < 2) {
        return invalid("progression.victory_level must be at least 2");
    }
    if (config.maxFrameDelta <= 0.0f) {
        return invalid("frame.max_delta must be positive");
    }
    if (config.chaserRatio < 0.0f || config.chaserRatio > 1.0f) {
        return invalid("population.chaser_ratio must lie in [0, 1]");
    }
    return GameResult<void>::ok();
}

GameResult<GameConfig> LoadGameConfig(const ConfigManager& source) {
    GameConfig config;

    const GameResult<void> steps[] = {
        overlay(source, "maze.initial_size", config.initialMazeSize),
        overlay(source, "maze.growth", config.mazeSizeGrowth),
        overlay(source, "maze.max_size", config.maxMazeSize),
        overlay(source, "maze.cell_size", config.cellSize),
        overlay(source, "maze.wall_height", config.wallHeight),
        overlay(source, "maze.extra_opening_ratio", config.extraOpeningRatio),

        overlay(source, "player.radius", config.playerRadius),
        overlay(source, "player.force", config.playerForce),
        overlay(source, "player.jump_force", config.jumpForce),
        overlay(source, "player.jump_cost", config.jumpCost),
        overlay(source, "player.jump_cooldown_ms", config.jumpCooldownMs),
        overlay(source, "player.boost_multiplier", config.boostMultiplier),
        overlay(source, "player.energy_regen", config.energyRegen),
        overlay(source, "player.energy_boost_cost", config.energyBoostCost),

        overlay(source, "physics.wall_restitution", config.wallRestitution),
        overlay(source, "physics.friction", config.friction),

        overlay(source, "pickups.collectible_radius", config.collectibleRadius),
        overlay(source, "pickups.powerup_radius", config.powerUpRadius),
        overlay(source, "pickups.goal_radius", config.goalRadius),

        overlay(source, "particles.pool_size", config.particlePoolSize),
        overlay(source, "particles.gravity", config.particleGravity),

        overlay(source, "enemies.contact_radius", config.enemyContactRadius),
        overlay(source, "enemies.damage", config.enemyDamage),
        overlay(source, "enemies.knockback", config.knockbackForce),
        overlay(source, "enemies.chaser_speed", config.chaserSpeed),
        overlay(source, "enemies.patrol_speed", config.patrolSpeed),
        overlay(source, "enemies.chase_multiplier", config.chaserSpeedMultiplier),

        overlay(source, "ai.chase_radius", config.aiChaseRadius),
        overlay(source, "ai.patrol_radius", config.aiPatrolRadius),
        overlay(source, "ai.repath_interval", config.aiRepathInterval),

        overlay(source, "effects.shield_ms", config.shieldDurationMs),
        overlay(source, "effects.speed_ms", config.speedDurationMs),
        overlay(source, "effects.multiplier_ms", config.multiplierDurationMs),
        overlay(source, "effects.multiplier_value", config.multiplierValue),

        overlay(source, "progression.victory_level", config.victoryLevel),
        overlay(source, "progression.transition_delay_ms", config.levelTransitionDelayMs),
        overlay(source, "progression.restart_penalty", config.restartPenalty),

        overlay(source, "population.enemy_base", config.enemyBase),
        overlay(source, "population.enemy_per_level", config.enemyPerLevel),
        overlay(source, "population.powerup_base", config.powerUpBase),
        overlay(source, "population.powerup_per_level", config.powerUpPerLevel),
        overlay(source, "population.collectible_factor", config.collectibleFactor),
        overlay(source, "population.chaser_ratio", config.chaserRatio),

        overlay(source, "frame.max_delta", config.maxFrameDelta),
    };
    for (const auto& step : steps) {
        if (!step) {
            return GameResult<GameConfig>::err(step.error());
        }
    }

    if (auto valid = ValidateGameConfig(config); !valid) {
        return GameResult<GameConfig>::err(valid.error());
    }
    return GameResult<GameConfig>::ok(config);
}

} // namespace nexus::game
