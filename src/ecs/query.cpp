/// @file query.cpp
/// @brief QueryCache implementation.

#include "nexus/ecs/query.hpp"

#include <utility>

namespace nexus::ecs {

QueryCache::QueryCache(std::vector<ComponentKindId> kinds) : kinds_(std::move(kinds)) {}

void QueryCache::OnChanged(Entity entity, bool matches) {
    if (matches) {
        if (!Contains(entity)) {
            index_.emplace(entity, members_.size());
            members_.push_back(entity);
        }
    } else {
        Erase(entity);
    }
}

void QueryCache::Erase(Entity entity) {
    auto it = index_.find(entity);
    if (it == index_.end()) {
        return;
    }
    const auto idx = it->second;
    const auto lastIdx = members_.size() - 1;
    if (idx != lastIdx) {
        members_[idx] = members_[lastIdx];
        index_[members_[idx]] = idx;
    }
    members_.pop_back();
    index_.erase(entity);
}

bool QueryCache::Contains(Entity entity) const noexcept {
    return index_.contains(entity);
}

void QueryCache::Clear() {
    members_.clear();
    index_.clear();
}

}  // namespace nexus::ecs
