#pragma once

/// @file scheduled_work.hpp
/// @brief Deferred callbacks run at frame boundaries.
///
/// Work is checked against wall-clock "now" at the start of each frame,
/// so it always runs on the simulation thread between two frames and can
/// be cancelled deterministically, unlike a detached timer.

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "nexus/ecs/entity.hpp"

namespace nexus::game {

using WorkId = uint64_t;

class ScheduledWorkQueue {
public:
    using Callback = std::function<void()>;

    /// Queue @p callback to run at the first RunDue() with now >= dueMs.
    /// @p owner groups work for CancelOwner(); pass Entity::invalid() for
    /// work that belongs to no entity.
    WorkId Schedule(int64_t dueMs, ecs::Entity owner, std::string label, Callback callback);

    /// @return false if @p id already ran or was cancelled.
    bool Cancel(WorkId id);

    /// Cancel everything owned by @p owner; returns how many were dropped.
    std::size_t CancelOwner(ecs::Entity owner);

    void Clear();

    /// Run due items one at a time, earliest first (ties in scheduling
    /// order). Items cancelled by an earlier callback do not run; items
    /// scheduled by a callback run in this pass only if already due.
    /// @return Number of callbacks run.
    std::size_t RunDue(int64_t nowMs);

    [[nodiscard]] std::size_t Pending() const noexcept { return items_.size(); }

    [[nodiscard]] bool IsPending(WorkId id) const noexcept;

private:
    struct Item {
        WorkId id = 0;
        int64_t dueMs = 0;
        ecs::Entity owner;
        std::string label;
        Callback callback;
    };

    std::vector<Item> items_;
    WorkId nextId_ = 1;
};

} // namespace nexus::game
