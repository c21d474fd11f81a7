/// @file scheduled_work.cpp
/// @brief ScheduledWorkQueue implementation.

#include "nexus/game/scheduled_work.hpp"

#include "nexus/foundation/game_logger.hpp"

#include <algorithm>

namespace nexus::game {

WorkId ScheduledWorkQueue::Schedule(int64_t dueMs, ecs::Entity owner, std::string label,
                                    Callback callback) {
    const WorkId id = nextId_++;
    items_.push_back(Item{id, dueMs, owner, std::move(label), std::move(callback)});
    return id;
}

bool ScheduledWorkQueue::Cancel(WorkId id) {
    return std::erase_if(items_, [id](const Item& item) { return item.id == id; }) > 0;
}

std::size_t ScheduledWorkQueue::CancelOwner(ecs::Entity owner) {
    return std::erase_if(items_, [owner](const Item& item) { return item.owner == owner; });
}

void ScheduledWorkQueue::Clear() {
    items_.clear();
}

bool ScheduledWorkQueue::IsPending(WorkId id) const noexcept {
    return std::any_of(items_.begin(), items_.end(),
                       [id](const Item& item) { return item.id == id; });
}

std::size_t ScheduledWorkQueue::RunDue(int64_t nowMs) {
    std::size_t ran = 0;
    for (;;) {
        auto next = items_.end();
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->dueMs <= nowMs && (next == items_.end() || it->dueMs < next->dueMs ||
                                       (it->dueMs == next->dueMs && it->id < next->id))) {
                next = it;
            }
        }
        if (next == items_.end()) {
            break;
        }

        Item item = std::move(*next);
        items_.erase(next);
        NEXUS_LOG_TRACE(foundation::LogCategory::Core, "Running scheduled work: " + item.label);
        item.callback();
        ++ran;
    }
    return ran;
}

} // namespace nexus::game
