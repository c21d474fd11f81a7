#pragma once

/// @file component_kind.hpp
/// @brief Typed handles for component kinds defined in a Registry.

#include <cstdint>

namespace nexus::ecs {

/// Small integer naming one component storage inside a Registry.
using ComponentKindId = uint32_t;

/// Sentinel meaning "no component kind".
constexpr ComponentKindId kInvalidComponentKind = static_cast<ComponentKindId>(-1);

/// Typed handle returned by Registry::DefineComponentKind<T>().
///
/// The type parameter ties the handle to its component type so that
/// registry accessors are statically typed; the id is what gets stored
/// in data (e.g. an effect timer naming the kind it must remove).
template <typename T>
struct ComponentKind {
    using value_type = T;

    ComponentKindId id = kInvalidComponentKind;

    [[nodiscard]] constexpr bool isValid() const noexcept { return id != kInvalidComponentKind; }

    constexpr bool operator==(const ComponentKind&) const = default;
};

} // namespace nexus::ecs
