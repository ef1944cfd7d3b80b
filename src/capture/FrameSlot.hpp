/**
 * @file FrameSlot.hpp
 * @brief Holds the most recent preview frame.
 *
 * Written from the capture context, read from the control and UI threads.
 * Last write wins: there is never more than one buffered frame.
 */

#pragma once
#include <QImage>
#include <mutex>
#include "util/Types.hpp"

namespace vb {

class FrameSlot {
public:
    // Deep-copies the frame; the caller's buffer may be reused afterwards
    void store(const QImage& frame);
    void clear();

    QImage latest() const;
    bool empty() const;
    u64 framesStored() const;

private:
    mutable std::mutex mutex_;
    QImage frame_;
    u64 stored_{0};
};

} // namespace vb
