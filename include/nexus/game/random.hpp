#pragma once

/// @file random.hpp
/// @brief Random engine alias and sampling helpers.
///
/// All randomness in the simulation flows through one seeded engine so a
/// run is reproducible from its seed.

#include <cstddef>
#include <cstdint>
#include <random>

namespace nexus::game {

using RandomEngine = std::mt19937;

/// Uniform float in [0, 1).
inline float RandomUnit(RandomEngine& rng) {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(rng);
}

/// Uniform float in [lo, hi).
inline float RandomRange(RandomEngine& rng, float lo, float hi) {
    return std::uniform_real_distribution<float>(lo, hi)(rng);
}

/// Uniform integer in [lo, hi] (inclusive).
inline int32_t RandomInt(RandomEngine& rng, int32_t lo, int32_t hi) {
    return std::uniform_int_distribution<int32_t>(lo, hi)(rng);
}

/// Uniform index in [0, count). @pre count > 0.
inline std::size_t RandomIndex(RandomEngine& rng, std::size_t count) {
    return std::uniform_int_distribution<std::size_t>(0, count - 1)(rng);
}

} // namespace nexus::game
