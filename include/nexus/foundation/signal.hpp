#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> for observer-style event dispatch.
///
/// Slots are invoked in connection order. The simulation is
/// single-threaded, so no locking is performed.

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace nexus::foundation {

/// Dispatches events to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<const GameEvent&> events;
///   auto id = events.connect([](const GameEvent& e) { playCue(e.type); });
///   events.emit(GameEvent{GameEventType::Collect});
///   events.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::erase_if(slots_, [id](const auto& entry) { return entry.first == id; });
    }

    void disconnectAll() { slots_.clear(); }

    /// Invoke every slot. Iterates a snapshot so slots may connect or
    /// disconnect while the signal is firing.
    void emit(Args... args) const {
        if (slots_.empty()) {
            return;
        }
        auto snapshot = slots_;
        for (const auto& [id, slot] : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

private:
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId nextId_ = 1;
};

} // namespace nexus::foundation
