#pragma once

/// @file effect_timer_system.hpp
/// @brief EffectTimerSystem: expires timed player effects.

#include <cstddef>
#include <string_view>

#include "nexus/ecs/system_scheduler.hpp"
#include "nexus/foundation/game_result.hpp"
#include "nexus/game/game_world.hpp"

namespace nexus::game {

/// Removes the effect component named by each due EffectTimer and
/// destroys the timer. A timer whose target is gone is dropped and
/// counted as stale.
class EffectTimerSystem final : public ecs::ISystem {
public:
    explicit EffectTimerSystem(GameWorld& world) : world_(world) {}

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Simulation;
    }

    [[nodiscard]] std::string_view GetName() const override { return "EffectTimerSystem"; }

    /// Due timers of the last Execute() whose target no longer existed.
    [[nodiscard]] std::size_t GetLastStaleCount() const noexcept { return lastStaleCount_; }

private:
    /// Remove the timed component from its target; StaleReference when
    /// the target entity is gone.
    foundation::GameResult<void> expire(const EffectTimer& effect);

    GameWorld& world_;
    std::size_t lastStaleCount_ = 0;
};

} // namespace nexus::game
