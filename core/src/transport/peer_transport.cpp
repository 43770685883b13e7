#include <transport/peer_transport.hpp>

namespace pv {
    const char* to_string(TransportState state) {
        switch (state) {
            case TransportState::New: return "new";
            case TransportState::Connecting: return "connecting";
            case TransportState::Connected: return "connected";
            case TransportState::Disconnected: return "disconnected";
            case TransportState::Failed: return "failed";
            case TransportState::Closed: return "closed";
        }
        return "unknown";
    }
}
