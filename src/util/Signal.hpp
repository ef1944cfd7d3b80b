/**
 * @file Signal.hpp
 * @brief Lightweight synchronous signal/slot for non-QObject classes.
 *
 * Slots run on the emitting thread, in connection order. Use Qt signals when
 * the receiver lives on another thread.
 */

#pragma once
#include <algorithm>
#include <functional>
#include <mutex>
#include <vector>
#include "Types.hpp"

namespace vb {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using ConnectionId = u64;

    ConnectionId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        auto id = nextId_++;
        slots_.push_back({id, std::move(slot)});
        return id;
    }

    void disconnect(ConnectionId id) {
        std::lock_guard lock(mutex_);
        std::erase_if(slots_, [id](const auto& s) { return s.id == id; });
    }

    void disconnectAll() {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    void emitSignal(Args... args) {
        std::vector<Entry> copy;
        {
            std::lock_guard lock(mutex_);
            copy = slots_;
        }
        for (auto& entry : copy)
            entry.slot(args...);
    }

    usize slotCount() const {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

private:
    struct Entry {
        ConnectionId id;
        Slot slot;
    };

    std::vector<Entry> slots_;
    ConnectionId nextId_{1};
    mutable std::mutex mutex_;
};

} // namespace vb
