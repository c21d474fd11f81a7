/// @file simulation.cpp
/// @brief Simulation facade: pipeline wiring and frame stepping.

#include "nexus/game/simulation.hpp"

#include "nexus/foundation/game_logger.hpp"
#include "nexus/game/ai_system.hpp"
#include "nexus/game/animation_system.hpp"
#include "nexus/game/collision_system.hpp"
#include "nexus/game/effect_timer_system.hpp"
#include "nexus/game/exploration_system.hpp"
#include "nexus/game/input_system.hpp"
#include "nexus/game/movement_system.hpp"
#include "nexus/game/particle_system.hpp"
#include "nexus/game/trail_system.hpp"

#include <algorithm>
#include <string>

namespace nexus::game {

using foundation::GameResult;
using foundation::LogCategory;

Simulation::Simulation(const GameConfig& config, uint32_t seed)
    : world_(std::make_unique<GameWorld>(config, seed)), levels_(*world_) {
    buildPipeline();

    world_->state.Subscribe(StatKind::Phase, [this](double) {
        NEXUS_LOG_INFO(LogCategory::Core,
                       "Phase changed to " + std::string(gamePhaseName(world_->state.Phase())));
    });
}

void Simulation::buildPipeline() {
    auto& world = *world_;
    scheduler_.Register<InputSystem>(world);
    scheduler_.Register<AISystem>(world);
    scheduler_.Register<MovementSystem>(world);
    scheduler_.Register<CollisionSystem>(world, levels_);
    scheduler_.Register<EffectTimerSystem>(world);
    scheduler_.Register<ExplorationSystem>(world);

    scheduler_.Register<ParticleSystem>(world);
    scheduler_.Register<TrailSystem>(world);
    scheduler_.Register<AnimationSystem>(world);

    scheduler_.AddDependency<InputSystem, AISystem>();
    scheduler_.AddDependency<AISystem, MovementSystem>();
    scheduler_.AddDependency<MovementSystem, CollisionSystem>();
    scheduler_.AddDependency<CollisionSystem, EffectTimerSystem>();
    scheduler_.AddDependency<EffectTimerSystem, ExplorationSystem>();

    scheduler_.AddDependency<ParticleSystem, TrailSystem>();
    scheduler_.AddDependency<TrailSystem, AnimationSystem>();

    if (auto built = scheduler_.Build(); !built) {
        NEXUS_LOG_ERROR(LogCategory::ECS, "Pipeline build failed: " + built.error().describe());
    }
}

GameResult<void> Simulation::Start(int64_t nowMs) {
    world_->frame.nowMs = nowMs;
    world_->frame.previousActions = ActionSet{};
    return levels_.RestartGame(nowMs);
}

void Simulation::Step(const FrameInput& input) {
    auto& frame = world_->frame;
    frame.deltaTime = std::clamp(input.deltaTime, 0.0f, world_->config.maxFrameDelta);
    frame.nowMs = input.nowMs;
    frame.actions = input.actions;
    if (input.cameraForward) {
        frame.cameraForward = *input.cameraForward;
    }

    world_->scheduled.RunDue(frame.nowMs);
    handleCommands();

    if (world_->state.Phase() == GamePhase::Playing) {
        scheduler_.ExecuteStage(ecs::SystemStage::Simulation, frame.deltaTime);
    }
    scheduler_.ExecuteStage(ecs::SystemStage::Presentation, frame.deltaTime);

    frame.previousActions = frame.actions;
}

void Simulation::handleCommands() {
    auto& frame = world_->frame;

    if (frame.actions.Pressed(Action::Restart, frame.previousActions)) {
        const auto phase = world_->state.Phase();
        const bool finished = phase == GamePhase::GameOver || phase == GamePhase::GameWon;
        auto result = finished ? levels_.RestartGame(frame.nowMs) : levels_.RestartLevel();
        if (!result) {
            NEXUS_LOG_ERROR(LogCategory::Level,
                            "Restart failed: " + result.error().describe());
        }
    }
    if (frame.actions.Pressed(Action::CameraToggle, frame.previousActions)) {
        world_->cameraMode = world_->cameraMode == CameraMode::ThirdPerson
            ? CameraMode::FirstPerson
            : CameraMode::ThirdPerson;
        world_->Emit(GameEventType::CameraToggled, world_->player.entity, {},
                     static_cast<float>(world_->cameraMode));
    }
    if (frame.actions.Pressed(Action::MuteToggle, frame.previousActions)) {
        world_->muted = !world_->muted;
        world_->Emit(GameEventType::MuteToggled, ecs::Entity::invalid(), {},
                     world_->muted ? 1.0f : 0.0f);
    }
}

HudSnapshot Simulation::Hud() const {
    const auto& world = *world_;
    const auto& registry = world.registry;
    const auto& kinds = world.kinds;
    const auto player = world.player.entity;

    HudSnapshot hud;
    hud.score = world.state.Score();
    hud.health = world.state.Health();
    hud.energy = world.state.Energy();
    hud.level = world.state.Level();
    hud.elapsedSeconds = static_cast<double>(world.frame.nowMs - world.gameStartMs) / 1000.0;
    if (const auto* position = registry.Find(kinds.position, player)) {
        hud.playerCell = world.mapping.WorldToGrid(position->ToVector());
    }
    hud.speedBoost = registry.HasComponent(kinds.speedBoost, player);
    hud.shield = registry.HasComponent(kinds.shield, player);
    hud.multiplierActive = registry.HasComponent(kinds.scoreMultiplier, player);
    hud.multiplier = world.PlayerMultiplier();
    hud.cameraMode = world.cameraMode;
    hud.visitedCells = world.exploration.VisitedCount();
    hud.phase = world.state.Phase();
    return hud;
}

GameResult<GridPath> Simulation::FindPath(GridCell start, GridCell goal) const {
    return Pathfinder::FindPath(world_->maze, start, goal);
}

Vector3 Simulation::GridToWorld(GridCell cell) const noexcept {
    return world_->mapping.GridToWorld(cell);
}

GridCell Simulation::WorldToGrid(const Vector3& point) const noexcept {
    return world_->mapping.WorldToGrid(point);
}

} // namespace nexus::game
