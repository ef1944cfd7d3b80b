/**
 * @file ReviewGate.hpp
 * @brief Keep-or-discard decision on a finished recording.
 *
 * review() returns immediately; the decision callback may run later and on
 * any thread. The session does not wait for it.
 */

#pragma once
#include <filesystem>
#include <functional>

namespace vb {

class ReviewGate {
public:
    using Decision = std::function<void(bool keep)>;

    virtual ~ReviewGate() = default;

    virtual void review(const std::filesystem::path& recording, Decision decide) = 0;
};

} // namespace vb
