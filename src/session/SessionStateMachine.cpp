#include "SessionStateMachine.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace vb {

SessionStateMachine::BusyGuard::BusyGuard(SessionStateMachine& machine,
                                          SessionState fallback)
    : machine_(&machine), fallback_(fallback) {}

SessionStateMachine::BusyGuard::BusyGuard(BusyGuard&& other) noexcept
    : machine_(std::exchange(other.machine_, nullptr)),
      fallback_(other.fallback_) {}

SessionStateMachine::BusyGuard::~BusyGuard() {
    if (machine_)
        machine_->set(fallback_);
}

void SessionStateMachine::BusyGuard::settle(SessionState state) {
    if (!machine_)
        return;
    std::exchange(machine_, nullptr)->set(state);
}

std::optional<SessionStateMachine::BusyGuard> SessionStateMachine::tryBegin(
        std::initializer_list<SessionState> from,
        SessionState fallback) {
    const auto current = state();
    if (std::find(from.begin(), from.end(), current) == from.end())
        return std::nullopt;

    set(SessionState::Busy);
    return BusyGuard(*this, fallback);
}

void SessionStateMachine::set(SessionState s) {
    const auto previous = state_.exchange(s);
    if (previous == s)
        return;
    LOG_DEBUG("Session: {} -> {}", toString(previous), toString(s));
    stateChanged.emitSignal(s);
}

} // namespace vb
