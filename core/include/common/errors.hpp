#pragma once

#include <stdexcept>
#include <string>

namespace pv {
    struct SessionError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Malformed or inapplicable offer/answer. Reported to the signaling caller.
    struct NegotiationError : SessionError {
        using SessionError::SessionError;
    };

    // No common codec between the local endpoint and the remote description.
    struct FormatError : SessionError {
        using SessionError::SessionError;
    };

    struct TransportFailure : SessionError {
        using SessionError::SessionError;
    };

    struct MediaSourceError : SessionError {
        using SessionError::SessionError;
    };

    struct UnsupportedFrameFormat : SessionError {
        using SessionError::SessionError;
    };
}
