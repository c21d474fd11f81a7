#pragma once

/// @file components.hpp
/// @brief Component types attached to maze entities.
///
/// Components are plain data. Empty structs are tags and occupy no
/// payload storage.

#include <cstdint>
#include <deque>
#include <vector>

#include "nexus/ecs/component_kind.hpp"
#include "nexus/ecs/entity.hpp"
#include "nexus/game/ai_types.hpp"
#include "nexus/game/game_types.hpp"
#include "nexus/game/maze_grid.hpp"
#include "nexus/game/math_types.hpp"

namespace nexus::game {

// ── Spatial ─────────────────────────────────────────────────────────────

struct Position {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    [[nodiscard]] Vector3 ToVector() const noexcept { return {x, y, z}; }

    void Assign(const Vector3& v) noexcept {
        x = v.x;
        y = v.y;
        z = v.z;
    }
};

struct Velocity {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    [[nodiscard]] Vector3 ToVector() const noexcept { return {x, y, z}; }

    void Assign(const Vector3& v) noexcept {
        x = v.x;
        y = v.y;
        z = v.z;
    }
};

// ── Roles ───────────────────────────────────────────────────────────────

struct Player {};
struct Goal {};
struct Collectible {};
struct Trail {};

/// Solid maze cell; the box spans halfSize around the entity position.
struct Wall {
    float halfSize = 1.25f;
};

struct PowerUp {
    PowerUpType type = PowerUpType::Speed;
};

struct Enemy {
    EnemyType type = EnemyType::Patrol;
    float speed = 1.5f;  ///< base speed, world units per second
};

/// Per-enemy navigation state kept in the registry.
struct AI {
    uint32_t timer = 0;  ///< incremented every simulation tick
    std::vector<GridCell> path;
    std::size_t pathIndex = 0;
    AIContextHandle behaviorHandle = kInvalidAIContext;
};

// ── Effects ─────────────────────────────────────────────────────────────

struct SpeedBoost {};
struct InvulnerabilityShield {};

struct ScoreMultiplier {
    int32_t value = 1;
};

/// Removes @c componentKind from @c targetEntity once wall-clock time
/// reaches @c expirationTime (milliseconds).
struct EffectTimer {
    ecs::Entity targetEntity;
    ecs::ComponentKindId componentKind = ecs::kInvalidComponentKind;
    int64_t expirationTime = 0;
};

// ── Presentation ────────────────────────────────────────────────────────

struct Particle {
    bool active = false;
    int32_t life = 0;     ///< remaining frames
    int32_t maxLife = 0;
    uint32_t color = 0;   ///< 0xRRGGBB
};

/// Bobbing and spinning parameters; @c rotation accumulates.
struct Animation {
    float speed = 0.0f;
    float phase = 0.0f;
    float rotation = 0.0f;
};

/// Recent player positions, newest last.
struct TrailPoints {
    std::deque<Vector3> points;
};

/// Palette used for particle bursts.
namespace palette {
inline constexpr uint32_t kPrimary = 0x00f4ff;
inline constexpr uint32_t kAccent = 0x8000ff;
inline constexpr uint32_t kDanger = 0xff0000;
inline constexpr uint32_t kSpark = 0xffd700;
inline constexpr uint32_t kWhite = 0xffffff;
} // namespace palette

} // namespace nexus::game
