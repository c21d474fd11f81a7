#pragma once

/// @file game_types.hpp
/// @brief Enumerations shared across the simulation layer.

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace nexus::game {

/// Lifecycle phase of the running game.
enum class GamePhase : uint8_t {
    Loading,        ///< No level populated yet.
    Playing,        ///< Simulation stage runs every frame.
    Transitioning,  ///< Goal reached, next level scheduled.
    GameOver,       ///< Health reached zero.
    GameWon         ///< Victory level reached.
};

constexpr std::string_view gamePhaseName(GamePhase phase) {
    switch (phase) {
        case GamePhase::Loading:       return "Loading";
        case GamePhase::Playing:       return "Playing";
        case GamePhase::Transitioning: return "Transitioning";
        case GamePhase::GameOver:      return "GameOver";
        case GamePhase::GameWon:       return "GameWon";
    }
    return "Unknown";
}

enum class EnemyType : uint8_t {
    Patrol,  ///< Wanders between random open cells.
    Chaser   ///< Wanders, but pursues the player when close.
};

enum class PowerUpType : uint8_t {
    Speed,
    Energy,
    Shield,
    Multiplier
};

inline constexpr std::size_t kPowerUpTypeCount = 4;

constexpr std::string_view powerUpName(PowerUpType type) {
    switch (type) {
        case PowerUpType::Speed:      return "Speed";
        case PowerUpType::Energy:     return "Energy";
        case PowerUpType::Shield:     return "Shield";
        case PowerUpType::Multiplier: return "Multiplier";
    }
    return "Unknown";
}

enum class CameraMode : uint8_t {
    ThirdPerson,
    FirstPerson
};

/// Abstract player intents produced by an input adapter.
enum class Action : uint8_t {
    MoveForward,
    MoveBack,
    MoveLeft,
    MoveRight,
    Jump,
    Boost,
    CameraToggle,
    Restart,
    MuteToggle
};

inline constexpr std::size_t kActionCount = 9;

/// Set of actions held during one frame.
class ActionSet {
public:
    constexpr ActionSet() = default;
    ActionSet(std::initializer_list<Action> actions) {
        for (auto action : actions) {
            Set(action);
        }
    }

    void Set(Action action, bool held = true) { bits_.set(index(action), held); }
    void Clear() { bits_.reset(); }

    [[nodiscard]] bool Has(Action action) const { return bits_.test(index(action)); }

    /// Held now but not in @p previous.
    [[nodiscard]] bool Pressed(Action action, const ActionSet& previous) const {
        return Has(action) && !previous.Has(action);
    }

    [[nodiscard]] bool Empty() const { return bits_.none(); }

    bool operator==(const ActionSet&) const = default;

private:
    static constexpr std::size_t index(Action action) { return static_cast<std::size_t>(action); }

    std::bitset<kActionCount> bits_;
};

} // namespace nexus::game
