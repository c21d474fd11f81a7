#pragma once

/// @file query.hpp
/// @brief Cached conjunctive component queries.
///
/// A QueryCache holds the set of entities that own every component kind
/// in its predicate. The Registry keeps it exact by calling OnChanged()
/// whenever a component of one of those kinds is added or removed, so a
/// lookup never rescans the store.

#include "nexus/ecs/component_kind.hpp"
#include "nexus/ecs/entity.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace nexus::ecs {

/// Handle for a query registered with Registry::DefineQuery().
struct QueryHandle {
    uint32_t index = static_cast<uint32_t>(-1);

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return index != static_cast<uint32_t>(-1);
    }

    constexpr bool operator==(const QueryHandle&) const = default;
};

/// Membership set of one query.
class QueryCache {
public:
    /// @param kinds Sorted, duplicate-free component kinds.
    explicit QueryCache(std::vector<ComponentKindId> kinds);

    [[nodiscard]] const std::vector<ComponentKindId>& Kinds() const noexcept { return kinds_; }

    /// True when @p entity satisfies the predicate; @p has answers
    /// "does entity own kind k".
    template <typename HasFn>
    [[nodiscard]] bool Matches(Entity entity, HasFn&& has) const {
        for (auto kind : kinds_) {
            if (!has(kind, entity)) {
                return false;
            }
        }
        return true;
    }

    /// Re-evaluate one entity after a component change or destruction.
    void OnChanged(Entity entity, bool matches);

    /// Drop @p entity from the set (destruction path).
    void Erase(Entity entity);

    [[nodiscard]] bool Contains(Entity entity) const noexcept;

    [[nodiscard]] const std::vector<Entity>& Members() const noexcept { return members_; }

    [[nodiscard]] std::size_t Count() const noexcept { return members_.size(); }

    void Clear();

private:
    std::vector<ComponentKindId> kinds_;
    std::vector<Entity> members_;
    std::unordered_map<Entity, std::size_t> index_;
};

}  // namespace nexus::ecs
