#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set based component storage for the ECS.
///
/// ComponentStorage<T> provides O(1) add / get / has / remove and dense
/// iteration over all components of type T. Empty component types (tags)
/// keep only the membership arrays and no payload.

#include "nexus/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace nexus::ecs {

/// Type-erased base for component pools, so the Registry can remove a
/// component or clear a pool without knowing its type.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Return the entity stored at dense @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;
};

/// Sparse-set component storage.
///
/// Memory layout:
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data (absent for tag types)
///   entities_[index]     -> entity that owns dense_[index]
/// @endcode
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;

    /// Tag components carry no data; only membership is stored.
    static constexpr bool kIsTag = std::is_empty_v<T>;

    // ── Capacity ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t Size() const override { return entities_.size(); }

    [[nodiscard]] bool Empty() const noexcept { return entities_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Add a component for @p entity, or overwrite the existing one.
    /// @return Mutable reference to the stored component.
    template <typename... Args>
    T& Emplace(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");

        if (Has(entity)) {
            if constexpr (kIsTag) {
                return tagInstance();
            } else {
                auto& slot = dense_[sparse_[entity.id()]];
                slot = T(std::forward<Args>(args)...);
                return slot;
            }
        }

        const auto idx = static_cast<uint32_t>(entities_.size());
        ensureSparseSize(entity.id());
        sparse_[entity.id()] = idx;
        entities_.push_back(entity);

        if constexpr (kIsTag) {
            return tagInstance();
        } else {
            dense_.emplace_back(std::forward<Args>(args)...);
            return dense_.back();
        }
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        if constexpr (kIsTag) {
            return tagInstance();
        } else {
            return dense_[sparse_[entity.id()]];
        }
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        if constexpr (kIsTag) {
            return tagInstance();
        } else {
            return dense_[sparse_[entity.id()]];
        }
    }

    /// Pointer to the component of @p entity, or nullptr.
    [[nodiscard]] T* TryGet(Entity entity) {
        return Has(entity) ? &Get(entity) : nullptr;
    }

    [[nodiscard]] const T* TryGet(Entity entity) const {
        return Has(entity) ? &Get(entity) : nullptr;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        auto eid = entity.id();
        return entity.isValid() && eid < sparse_.size() && sparse_[eid] != kInvalidIndex;
    }

    /// Remove the component owned by @p entity (no-op when absent).
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(entities_.size() - 1);

        if (idx != lastIdx) {
            if constexpr (!kIsTag) {
                dense_[idx] = std::move(dense_[lastIdx]);
            }
            entities_[idx] = entities_[lastIdx];
            sparse_[entities_[idx].id()] = idx;
        }

        if constexpr (!kIsTag) {
            dense_.pop_back();
        }
        entities_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;
    }

    void Clear() override {
        if constexpr (!kIsTag) {
            dense_.clear();
        }
        entities_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    // ── Iteration ───────────────────────────────────────────────────────

    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        assert(index < entities_.size());
        return entities_[index];
    }

    /// Owners in dense order.
    [[nodiscard]] const std::vector<Entity>& Entities() const noexcept { return entities_; }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    static T& tagInstance() {
        static T instance{};
        return instance;
    }

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;            ///< Packed component data (unused for tags).
    std::vector<Entity> entities_;    ///< dense index -> owner.
    std::vector<uint32_t> sparse_;    ///< entity id  -> dense index.
};

}  // namespace nexus::ecs
