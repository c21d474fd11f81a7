/// @file effect_timer_system.cpp
/// @brief EffectTimerSystem implementation.

#include "nexus/game/effect_timer_system.hpp"

#include "nexus/foundation/game_logger.hpp"

#include <string>

namespace nexus::game {

void EffectTimerSystem::Execute(float /*deltaTime*/) {
    auto& registry = world_.registry;
    const int64_t now = world_.frame.nowMs;
    lastStaleCount_ = 0;

    for (auto timer : registry.Snapshot(world_.queries.timers)) {
        const auto* effect = registry.Find(world_.kinds.effectTimer, timer);
        if (effect == nullptr || now < effect->expirationTime) {
            continue;
        }
        if (auto expired = expire(*effect); !expired) {
            ++lastStaleCount_;
            NEXUS_LOG_TRACE(foundation::LogCategory::Gameplay, expired.error().describe());
        }
        registry.DestroyEntity(timer);
    }
}

foundation::GameResult<void> EffectTimerSystem::expire(const EffectTimer& effect) {
    if (!world_.registry.EntityExists(effect.targetEntity)) {
        return foundation::GameResult<void>::err(foundation::GameError(
            foundation::ErrorCode::StaleReference,
            "effect timer target " + std::to_string(effect.targetEntity.id()) + " is gone",
            effect.targetEntity));
    }
    world_.registry.RemoveComponent(effect.componentKind, effect.targetEntity);
    return foundation::GameResult<void>::ok();
}

} // namespace nexus::game
