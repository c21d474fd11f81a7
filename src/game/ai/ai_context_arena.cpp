/// @file ai_context_arena.cpp
/// @brief AIContextArena implementation.

#include "nexus/game/ai_types.hpp"

namespace nexus::game {

AIContextHandle AIContextArena::Create(ecs::Entity entity) {
    if (auto it = byEntity_.find(entity); it != byEntity_.end()) {
        return it->second;
    }

    AIContextHandle handle;
    if (!free_.empty()) {
        handle = free_.back();
        free_.pop_back();
    } else {
        handle = static_cast<AIContextHandle>(slots_.size());
        slots_.emplace_back();
    }
    slots_[handle] = AIContext{entity, AIState::Patrol, 0, true};
    byEntity_.emplace(entity, handle);
    return handle;
}

AIContext* AIContextArena::Get(AIContextHandle handle) {
    if (handle >= slots_.size() || !slots_[handle].active) {
        return nullptr;
    }
    return &slots_[handle];
}

const AIContext* AIContextArena::Get(AIContextHandle handle) const {
    if (handle >= slots_.size() || !slots_[handle].active) {
        return nullptr;
    }
    return &slots_[handle];
}

AIContext* AIContextArena::FindByEntity(ecs::Entity entity) {
    auto it = byEntity_.find(entity);
    return it == byEntity_.end() ? nullptr : Get(it->second);
}

void AIContextArena::Release(AIContextHandle handle) {
    auto* context = Get(handle);
    if (context == nullptr) {
        return;
    }
    byEntity_.erase(context->entity);
    *context = AIContext{};
    free_.push_back(handle);
}

void AIContextArena::Clear() {
    slots_.clear();
    free_.clear();
    byEntity_.clear();
}

} // namespace nexus::game
