#include <session/session_state.hpp>

namespace pv {
    const char* to_string(SessionState state) {
        switch (state) {
            case SessionState::Negotiating: return "negotiating";
            case SessionState::Connecting: return "connecting";
            case SessionState::Active: return "active";
            case SessionState::Closing: return "closing";
            case SessionState::Closed: return "closed";
            case SessionState::Failed: return "failed";
        }
        return "unknown";
    }

    bool can_transition(SessionState from, SessionState to) {
        switch (from) {
            case SessionState::Negotiating:
                return to == SessionState::Connecting || to == SessionState::Failed || to == SessionState::Closing;
            case SessionState::Connecting:
                return to == SessionState::Active || to == SessionState::Failed || to == SessionState::Closing;
            case SessionState::Active:
                return to == SessionState::Failed || to == SessionState::Closing;
            case SessionState::Failed:
                return to == SessionState::Closing;
            case SessionState::Closing:
                return to == SessionState::Closed;
            case SessionState::Closed:
                return false;
        }
        return false;
    }
}
