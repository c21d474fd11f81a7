/// @file system_scheduler.cpp
/// @brief Per-stage ordering of the system pipeline.

#include "nexus/ecs/system_scheduler.hpp"

#include "nexus/foundation/game_logger.hpp"

namespace nexus::ecs {

namespace {
const std::vector<SystemTypeId> kEmptyOrder;
}  // namespace

bool SystemScheduler::AddDependency(SystemTypeId before, SystemTypeId after) {
    auto itBefore = systems_.find(before);
    auto itAfter = systems_.find(after);
    if (itBefore == systems_.end() || itAfter == systems_.end()) {
        return false;
    }
    if (itBefore->second.stage != itAfter->second.stage) {
        return false;
    }

    successors_[before].insert(after);
    built_ = false;
    return true;
}

void SystemScheduler::SetEnabled(SystemTypeId system, bool enabled) {
    if (auto it = systems_.find(system); it != systems_.end()) {
        it->second.enabled = enabled;
    }
}

bool SystemScheduler::IsEnabled(SystemTypeId system) const {
    if (auto it = systems_.find(system); it != systems_.end()) {
        return it->second.enabled;
    }
    return false;
}

foundation::GameResult<void> SystemScheduler::Build() {
    built_ = false;
    for (std::size_t stage = 0; stage < kSystemStageCount; ++stage) {
        auto stalled = orderStage(registered_[stage], order_[stage]);
        if (stalled.empty()) {
            continue;
        }

        std::vector<std::string> names;
        std::string joined;
        for (auto id : stalled) {
            names.emplace_back(systems_.at(id).instance->GetName());
            joined += joined.empty() ? names.back() : ", " + names.back();
        }
        for (auto& order : order_) {
            order.clear();
        }
        const std::string message = "Dependency cycle between systems: " + joined;
        NEXUS_LOG_ERROR(foundation::LogCategory::ECS, message);
        return foundation::GameResult<void>::err(
            foundation::GameError(foundation::ErrorCode::SystemError, message, std::move(names)));
    }
    built_ = true;
    return foundation::GameResult<void>::ok();
}

std::vector<SystemTypeId> SystemScheduler::orderStage(const std::vector<SystemTypeId>& registered,
                                                      std::vector<SystemTypeId>& order) const {
    // Count, for every system, the predecessors still waiting to be placed.
    std::unordered_map<SystemTypeId, uint32_t> waiting;
    for (auto id : registered) {
        waiting.emplace(id, 0U);
    }
    for (auto id : registered) {
        auto it = successors_.find(id);
        if (it == successors_.end()) {
            continue;
        }
        for (auto next : it->second) {
            if (auto w = waiting.find(next); w != waiting.end()) {
                ++w->second;
            }
        }
    }

    order.clear();
    order.reserve(registered.size());
    for (auto id : registered) {
        if (waiting[id] == 0) {
            order.push_back(id);
        }
    }

    // `order` doubles as the work queue; successors are appended in
    // registration order so unconstrained systems keep that order.
    for (std::size_t head = 0; head < order.size(); ++head) {
        auto it = successors_.find(order[head]);
        if (it == successors_.end()) {
            continue;
        }
        for (auto candidate : registered) {
            if (it->second.contains(candidate) && --waiting[candidate] == 0) {
                order.push_back(candidate);
            }
        }
    }

    std::vector<SystemTypeId> stalled;
    if (order.size() != registered.size()) {
        for (auto id : registered) {
            if (waiting[id] != 0) {
                stalled.push_back(id);
            }
        }
    }
    return stalled;
}

void SystemScheduler::ExecuteStage(SystemStage stage, float deltaTime) {
    if (!built_) {
        return;
    }
    for (auto id : order_[stageIndex(stage)]) {
        auto& entry = systems_.at(id);
        if (entry.enabled) {
            entry.instance->Execute(deltaTime);
        }
    }
}

const std::vector<SystemTypeId>& SystemScheduler::GetExecutionOrder(SystemStage stage) const {
    return built_ ? order_[stageIndex(stage)] : kEmptyOrder;
}

std::vector<std::string_view> SystemScheduler::GetExecutionNames(SystemStage stage) const {
    std::vector<std::string_view> names;
    for (auto id : GetExecutionOrder(stage)) {
        names.push_back(systems_.at(id).instance->GetName());
    }
    return names;
}

} // namespace nexus::ecs
