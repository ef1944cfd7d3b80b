#include "FrameSlot.hpp"

namespace vb {

void FrameSlot::store(const QImage& frame) {
    // Copy outside the lock, swap inside it
    QImage owned = frame.copy();
    std::lock_guard lock(mutex_);
    frame_.swap(owned);
    ++stored_;
}

void FrameSlot::clear() {
    QImage released;
    std::lock_guard lock(mutex_);
    frame_.swap(released);
}

QImage FrameSlot::latest() const {
    std::lock_guard lock(mutex_);
    return frame_;
}

bool FrameSlot::empty() const {
    std::lock_guard lock(mutex_);
    return frame_.isNull();
}

u64 FrameSlot::framesStored() const {
    std::lock_guard lock(mutex_);
    return stored_;
}

} // namespace vb
