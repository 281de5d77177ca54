/**
 * @file Signal.hpp
 * @brief Lightweight thread-safe signal/slot implementation.
 *
 * Slots are invoked synchronously on the emitting thread. Connections are
 * identified by the id returned from connect().
 */

#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <vector>
#include "util/Types.hpp"

namespace mc {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using ConnectionId = u64;

    ConnectionId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(ConnectionId id) {
        std::lock_guard lock(mutex_);
        slots_.erase(id);
    }

    void disconnectAll() {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    void emitSignal(Args... args) const {
        // Copy so a slot may disconnect itself while being called
        std::vector<Slot> targets;
        {
            std::lock_guard lock(mutex_);
            targets.reserve(slots_.size());
            for (const auto& [id, slot] : slots_)
                targets.push_back(slot);
        }
        for (const auto& slot : targets)
            slot(args...);
    }

private:
    std::map<ConnectionId, Slot> slots_;
    ConnectionId nextId_{1};
    mutable std::mutex mutex_;
};

} // namespace mc
