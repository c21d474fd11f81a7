/// @file game_state.cpp
/// @brief GameState implementation.

#include "nexus/game/game_state.hpp"

#include <algorithm>

namespace nexus::game {

GameState::GameState(int32_t maxHealth, float maxEnergy)
    : maxHealth_(maxHealth), maxEnergy_(maxEnergy), health_(maxHealth), energy_(maxEnergy) {}

bool GameState::SetScore(int64_t score) {
    if (score == score_) {
        return false;
    }
    score_ = score;
    notify(StatKind::Score, static_cast<double>(score_));
    return true;
}

void GameState::AddScore(int64_t points, int32_t multiplier) {
    SetScore(score_ + points * multiplier);
}

bool GameState::SetHealth(int32_t health) {
    const auto clamped = std::clamp(health, 0, maxHealth_);
    if (clamped == health_) {
        return false;
    }
    health_ = clamped;
    notify(StatKind::Health, static_cast<double>(health_));
    return true;
}

bool GameState::SetEnergy(float energy) {
    const auto clamped = std::clamp(energy, 0.0f, maxEnergy_);
    if (clamped == energy_) {
        return false;
    }
    energy_ = clamped;
    notify(StatKind::Energy, static_cast<double>(energy_));
    return true;
}

bool GameState::SetLevel(uint32_t level) {
    if (level == level_) {
        return false;
    }
    level_ = level;
    notify(StatKind::Level, static_cast<double>(level_));
    return true;
}

bool GameState::SetPhase(GamePhase phase) {
    if (phase == phase_) {
        return false;
    }
    phase_ = phase;
    notify(StatKind::Phase, static_cast<double>(static_cast<uint8_t>(phase_)));
    return true;
}

void GameState::Reset() {
    SetScore(0);
    SetHealth(maxHealth_);
    SetEnergy(maxEnergy_);
    SetLevel(1);
}

GameState::SubscriptionId GameState::Subscribe(StatKind kind, Listener listener) {
    return listeners_[static_cast<std::size_t>(kind)].connect(std::move(listener));
}

void GameState::Unsubscribe(StatKind kind, SubscriptionId id) {
    listeners_[static_cast<std::size_t>(kind)].disconnect(id);
}

void GameState::notify(StatKind kind, double value) const {
    listeners_[static_cast<std::size_t>(kind)].emit(value);
}

} // namespace nexus::game
