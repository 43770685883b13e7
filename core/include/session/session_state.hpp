#pragma once

namespace pv {
    enum class SessionState {
        Negotiating,
        Connecting,
        Active,
        Closing,
        Closed,
        Failed
    };

    const char* to_string(SessionState state);

    // Forward-only. Active never goes back to Connecting, Closing/Closed absorb.
    bool can_transition(SessionState from, SessionState to);

    inline bool is_terminal(SessionState s) {
        return s == SessionState::Closing || s == SessionState::Closed;
    }
}
