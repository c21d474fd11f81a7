/// @file entity_manager.cpp
/// @brief EntityManager implementation.

#include "nexus/ecs/entity_manager.hpp"

namespace nexus::ecs {

Entity EntityManager::Create() {
    const Entity entity(nextId_++);
    if (position_.size() <= entity.id()) {
        position_.resize(static_cast<std::size_t>(entity.id()) + 1, kNotAlive);
    }
    position_[entity.id()] = static_cast<uint32_t>(alive_.size());
    alive_.push_back(entity);
    return entity;
}

bool EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return false;
    }

    const auto idx = position_[entity.id()];
    const auto lastIdx = static_cast<uint32_t>(alive_.size() - 1);
    if (idx != lastIdx) {
        alive_[idx] = alive_[lastIdx];
        position_[alive_[idx].id()] = idx;
    }
    alive_.pop_back();
    position_[entity.id()] = kNotAlive;
    return true;
}

bool EntityManager::IsAlive(Entity entity) const noexcept {
    return entity.isValid() && entity.id() < position_.size() &&
           position_[entity.id()] != kNotAlive;
}

}  // namespace nexus::ecs
