#pragma once

/// @file game_events.hpp
/// @brief Presentation events emitted by the simulation.
///
/// Audio, camera and UI adapters subscribe to these; the core never waits
/// for them.

#include <cstdint>
#include <string_view>

#include "nexus/ecs/entity.hpp"
#include "nexus/foundation/signal.hpp"
#include "nexus/game/math_types.hpp"

namespace nexus::game {

enum class GameEventType : uint8_t {
    Move,           ///< Periodic footstep cue while moving
    Jump,
    Collect,
    PowerUp,
    Damage,
    LevelUp,
    EnemyAlert,     ///< An enemy started chasing
    BoostStart,
    BoostEnd,
    Scrape,         ///< Fast wall contact
    ScreenShake,    ///< intensity carries the shake strength
    MuteToggled,
    CameraToggled,
    LevelCreated,
    GameOver,
    GameWon
};

constexpr std::string_view gameEventName(GameEventType type) {
    switch (type) {
        case GameEventType::Move:          return "Move";
        case GameEventType::Jump:          return "Jump";
        case GameEventType::Collect:       return "Collect";
        case GameEventType::PowerUp:       return "PowerUp";
        case GameEventType::Damage:        return "Damage";
        case GameEventType::LevelUp:       return "LevelUp";
        case GameEventType::EnemyAlert:    return "EnemyAlert";
        case GameEventType::BoostStart:    return "BoostStart";
        case GameEventType::BoostEnd:      return "BoostEnd";
        case GameEventType::Scrape:        return "Scrape";
        case GameEventType::ScreenShake:   return "ScreenShake";
        case GameEventType::MuteToggled:   return "MuteToggled";
        case GameEventType::CameraToggled: return "CameraToggled";
        case GameEventType::LevelCreated:  return "LevelCreated";
        case GameEventType::GameOver:      return "GameOver";
        case GameEventType::GameWon:       return "GameWon";
    }
    return "Unknown";
}

struct GameEvent {
    GameEventType type = GameEventType::Move;
    ecs::Entity source;      ///< entity the event concerns, if any
    Vector3 position;
    float intensity = 0.0f;
};

using GameEventBus = foundation::Signal<const GameEvent&>;

} // namespace nexus::game
