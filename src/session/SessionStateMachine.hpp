/**
 * @file SessionStateMachine.hpp
 * @brief Session states and the scoped Busy guard.
 *
 * Busy is held for the whole of any multi-step operation. The guard always
 * leaves it into a settled state, on early returns and exceptions as well.
 */

#pragma once
#include <QMetaType>
#include <atomic>
#include <initializer_list>
#include <optional>
#include <utility>
#include "util/Signal.hpp"

namespace vb {

enum class SessionState { Idle, Previewing, Recording, Busy };

inline const char* toString(SessionState s) {
    switch (s) {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Previewing:
        return "Previewing";
    case SessionState::Recording:
        return "Recording";
    case SessionState::Busy:
        return "Busy";
    }
    return "Idle";
}

class SessionStateMachine {
public:
    class BusyGuard {
    public:
        BusyGuard(BusyGuard&& other) noexcept;
        BusyGuard& operator=(BusyGuard&&) = delete;
        BusyGuard(const BusyGuard&) = delete;
        BusyGuard& operator=(const BusyGuard&) = delete;
        ~BusyGuard();

        // Leaves Busy into the given state; later calls are ignored
        void settle(SessionState state);

        // State used if the guard is destroyed unsettled
        void setFallback(SessionState state) {
            fallback_ = state;
        }

    private:
        friend class SessionStateMachine;
        BusyGuard(SessionStateMachine& machine, SessionState fallback);

        SessionStateMachine* machine_;
        SessionState fallback_;
    };

    SessionState state() const {
        return state_.load();
    }
    bool is(SessionState s) const {
        return state() == s;
    }

    // Enters Busy when the current state is one of `from`, nullopt otherwise.
    // Not thread-safe: only the control thread mutates the state.
    std::optional<BusyGuard> tryBegin(std::initializer_list<SessionState> from,
                                      SessionState fallback = SessionState::Idle);

    Signal<SessionState> stateChanged;

private:
    void set(SessionState s);

    std::atomic<SessionState> state_{SessionState::Idle};
};

} // namespace vb

Q_DECLARE_METATYPE(vb::SessionState)
