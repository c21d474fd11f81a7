/// @file registry.cpp
/// @brief Registry implementation: destruction and query maintenance.

#include "nexus/ecs/registry.hpp"

#include <algorithm>

namespace nexus::ecs {

namespace {
const std::vector<Entity> kEmptyMembers;
}  // namespace

void Registry::DestroyEntity(Entity entity) {
    if (!entities_.IsAlive(entity)) {
        return;
    }
    for (ComponentKindId kind = 0; kind < storages_.size(); ++kind) {
        if (storages_[kind]->Has(entity)) {
            for (auto q : kindToQueries_[kind]) {
                queries_[q].Erase(entity);
            }
            storages_[kind]->Remove(entity);
        }
    }
    entities_.Destroy(entity);
}

void Registry::RemoveComponent(ComponentKindId kind, Entity entity) {
    if (!knownKind(kind) || !storages_[kind]->Has(entity)) {
        return;
    }
    storages_[kind]->Remove(entity);
    onComponentRemoved(kind, entity);
}

bool Registry::HasComponent(ComponentKindId kind, Entity entity) const {
    return knownKind(kind) && storages_[kind]->Has(entity);
}

QueryHandle Registry::DefineQuery(std::vector<ComponentKindId> kinds) {
    std::sort(kinds.begin(), kinds.end());
    kinds.erase(std::unique(kinds.begin(), kinds.end()), kinds.end());
    if (kinds.empty() || !std::all_of(kinds.begin(), kinds.end(),
                                      [this](ComponentKindId k) { return knownKind(k); })) {
        return QueryHandle{};
    }

    if (auto it = queryIndex_.find(kinds); it != queryIndex_.end()) {
        return QueryHandle{it->second};
    }

    const auto index = static_cast<uint32_t>(queries_.size());
    auto& cache = queries_.emplace_back(kinds);
    for (auto kind : kinds) {
        kindToQueries_[kind].push_back(index);
    }
    queryIndex_.emplace(std::move(kinds), index);

    // Seed from the smallest storage; members must own all kinds anyway.
    auto smallest = *std::min_element(
        cache.Kinds().begin(), cache.Kinds().end(),
        [this](ComponentKindId a, ComponentKindId b) {
            return storages_[a]->Size() < storages_[b]->Size();
        });
    const auto& pool = *storages_[smallest];
    for (std::size_t i = 0; i < pool.Size(); ++i) {
        auto entity = pool.EntityAt(i);
        cache.OnChanged(entity, cache.Matches(entity, [this](ComponentKindId k, Entity e) {
            return storages_[k]->Has(e);
        }));
    }
    return QueryHandle{index};
}

const std::vector<Entity>& Registry::Resolve(QueryHandle query) const {
    if (!query.isValid() || query.index >= queries_.size()) {
        return kEmptyMembers;
    }
    return queries_[query.index].Members();
}

void Registry::onComponentAdded(ComponentKindId kind, Entity entity) {
    for (auto q : kindToQueries_[kind]) {
        auto& cache = queries_[q];
        cache.OnChanged(entity, cache.Matches(entity, [this](ComponentKindId k, Entity e) {
            return storages_[k]->Has(e);
        }));
    }
}

void Registry::onComponentRemoved(ComponentKindId kind, Entity entity) {
    for (auto q : kindToQueries_[kind]) {
        queries_[q].Erase(entity);
    }
}

}  // namespace nexus::ecs
