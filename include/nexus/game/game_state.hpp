#pragma once

/// @file game_state.hpp
/// @brief Observable HUD state: score, health, energy, level and phase.

#include <array>
#include <cstdint>
#include <functional>

#include "nexus/foundation/signal.hpp"
#include "nexus/game/game_types.hpp"

namespace nexus::game {

enum class StatKind : uint8_t {
    Score,
    Health,
    Energy,
    Level,
    Phase
};

inline constexpr std::size_t kStatKindCount = 5;

/// Clamped scalar state with change notification.
///
/// Health and energy clamp to [0, max]. Every setter notifies, and returns
/// true, only when the stored value actually changes.
class GameState {
public:
    using Listener = std::function<void(double)>;
    using SubscriptionId = foundation::Signal<double>::SlotId;

    explicit GameState(int32_t maxHealth = 100, float maxEnergy = 100.0f);

    GameState(const GameState&) = delete;
    GameState& operator=(const GameState&) = delete;

    [[nodiscard]] int64_t Score() const noexcept { return score_; }
    [[nodiscard]] int32_t Health() const noexcept { return health_; }
    [[nodiscard]] float Energy() const noexcept { return energy_; }
    [[nodiscard]] uint32_t Level() const noexcept { return level_; }
    [[nodiscard]] GamePhase Phase() const noexcept { return phase_; }

    [[nodiscard]] int32_t MaxHealth() const noexcept { return maxHealth_; }
    [[nodiscard]] float MaxEnergy() const noexcept { return maxEnergy_; }

    bool SetScore(int64_t score);

    /// Add points * multiplier.
    void AddScore(int64_t points, int32_t multiplier = 1);

    /// @return true when the clamped value differs from the previous one.
    bool SetHealth(int32_t health);
    bool SetEnergy(float energy);

    bool SetLevel(uint32_t level);

    /// @return true when the phase changed.
    bool SetPhase(GamePhase phase);

    /// Back to score 0, full health and energy, level 1. Phase is left to
    /// the lifecycle owner.
    void Reset();

    SubscriptionId Subscribe(StatKind kind, Listener listener);
    void Unsubscribe(StatKind kind, SubscriptionId id);

private:
    void notify(StatKind kind, double value) const;

    int32_t maxHealth_;
    float maxEnergy_;

    int64_t score_ = 0;
    int32_t health_;
    float energy_;
    uint32_t level_ = 1;
    GamePhase phase_ = GamePhase::Loading;

    std::array<foundation::Signal<double>, kStatKindCount> listeners_;
};

} // namespace nexus::game
