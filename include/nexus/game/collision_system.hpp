#pragma once

/// @file collision_system.hpp
/// @brief CollisionSystem: walls, pickups, enemy contact and the goal.

#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

class LevelManager;

/// Resolves every player interaction of a frame, in order:
///   1. Wall contact in the 3x3 cells around the player.
///   2. Collectible and power-up pickup.
///   3. Enemy contact damage (skipped while shielded).
///   4. Enemy-enemy separation.
///   5. Goal arrival, which either wins the game or schedules the next
///      level through the LevelManager.
class CollisionSystem final : public ecs::ISystem {
public:
    CollisionSystem(GameWorld& world, LevelManager& levels) : world_(world), levels_(levels) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Simulation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "CollisionSystem"; }

private:
    static constexpr int kMaxWallPasses = 3;

    void resolveWalls(Position& position, Velocity& velocity);

    /// Push the player out of wall @p cell and reflect velocity into it.
    /// @return true if the player overlapped the wall.
    bool pushOutOfWall(GridCell cell, Position& position, Velocity& velocity);
    void collectPickups(const Position& position);
    void applyPowerUp(PowerUpType type);

    /// @return false when the contact ended the game.
    bool resolveEnemyContact(Position& position, Velocity& velocity);
    void separateEnemies();
    void checkGoal(const Position& position);

    GameWorld& world_;
    LevelManager& levels_;
};

} // namespace nexus::game
