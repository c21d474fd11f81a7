/// @file input_system.cpp
/// @brief InputSystem implementation.

#include "nexus/game/input_system.hpp"

#include "nexus/foundation/game_logger.hpp"

namespace nexus::game {

namespace {

/// Horizontal forward/right basis for the current camera mode.
void movementBasis(const FrameContext& frame, CameraMode mode, Vector3& forward, Vector3& right) {
    if (mode == CameraMode::FirstPerson) {
        forward = {0.0f, 0.0f, -1.0f};
        right = {1.0f, 0.0f, 0.0f};
        return;
    }
    forward = frame.cameraForward.Horizontal().Normalized();
    if (forward.LengthSquared() < 1e-6f) {
        forward = {0.0f, 0.0f, -1.0f};
    }
    right = forward.Cross(Vector3::Up());
}

} // namespace

void InputSystem::Execute(float deltaTime) {
    auto* position = world_.PlayerPosition();
    auto* velocity = world_.PlayerVelocity();
    if (position == nullptr || velocity == nullptr) {
        return;
    }

    const auto& config = world_.config;
    const auto& actions = world_.frame.actions;
    auto& control = world_.player;
    auto& state = world_.state;

    Vector3 forward;
    Vector3 right;
    movementBasis(world_.frame, world_.cameraMode, forward, right);

    Vector3 direction;
    if (actions.Has(Action::MoveForward)) {
        direction += forward;
    }
    if (actions.Has(Action::MoveBack)) {
        direction -= forward;
    }
    if (actions.Has(Action::MoveRight)) {
        direction += right;
    }
    if (actions.Has(Action::MoveLeft)) {
        direction -= right;
    }
    const bool moving = direction.LengthSquared() > 0.0f;

    float multiplier = 1.0f;
    if (world_.registry.HasComponent(world_.kinds.speedBoost, control.entity)) {
        multiplier *= config.speedBoostMultiplier;
    }
    const bool boosting = actions.Has(Action::Boost) && state.Energy() >= config.energyBoostCost;
    if (boosting) {
        multiplier *= config.boostMultiplier;
    }

    // ── Movement and energy ─────────────────────────────────────────

    if (moving) {
        const Vector3 push = direction.Normalized() * (config.playerForce * multiplier * deltaTime);
        velocity->x += push.x;
        velocity->z += push.z;

        ++control.moveTimer;
        if (config.moveCueInterval > 0 && control.moveTimer % config.moveCueInterval == 0) {
            world_.Emit(GameEventType::Move, control.entity, position->ToVector());
        }
    }

    if (moving && boosting) {
        state.SetEnergy(state.Energy() - config.energyBoostCost);
        if (!control.boosting) {
            control.boosting = true;
            world_.Emit(GameEventType::BoostStart, control.entity, position->ToVector());
        }
    } else {
        state.SetEnergy(state.Energy() + config.energyRegen);
        if (control.boosting) {
            control.boosting = false;
            world_.Emit(GameEventType::BoostEnd, control.entity, position->ToVector());
        }
    }

    // ── Dash ────────────────────────────────────────────────────────

    if (!actions.Has(Action::Jump) || !control.jumpReady || state.Energy() < config.jumpCost) {
        return;
    }

    control.jumpReady = false;
    auto& world = world_;
    world_.scheduled.Schedule(world_.frame.nowMs + config.jumpCooldownMs, control.entity,
                              "jump-cooldown", [&world] { world.player.jumpReady = true; });

    state.SetEnergy(state.Energy() - config.jumpCost);
    world_.Emit(GameEventType::Jump, control.entity, position->ToVector());
    world_.RequestScreenShake(5.0f);

    Vector3 dash = velocity->ToVector().Horizontal();
    if (dash.LengthSquared() < 0.01f) {
        dash = forward;
    }
    dash = dash.Normalized() * config.jumpForce;
    velocity->x += dash.x;
    velocity->z += dash.z;

    world_.particles.Burst(position->ToVector(), palette::kPrimary, 8);
    NEXUS_LOG_TRACE(foundation::LogCategory::Gameplay, "Player dashed");
}

} // namespace nexus::game
