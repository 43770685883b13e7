#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <media/media_format.hpp>

namespace pv {
    enum class TransportState {
        New,
        Connecting,
        Connected,
        Disconnected,
        Failed,
        Closed
    };

    enum class SdpType {
        Offer,
        Answer
    };

    enum class TrackDirection {
        SendOnly,
        RecvOnly
    };

    struct SessionDescription {
        SdpType type = SdpType::Offer;
        std::string sdp;
    };

    struct IceCandidate {
        unsigned mline_index = 0;
        std::string candidate;
    };

    const char* to_string(TransportState state);

    class IPeerTransport {
    public:
        using StateHandler = std::function<void(TransportState)>;
        using CandidateHandler = std::function<void(const IceCandidate&)>;
        using FrameHandler = std::function<void(MediaKind, const uint8_t*, size_t, int64_t)>;

        virtual ~IPeerTransport() = default;

        // Handlers are installed once, before negotiation, and may be invoked from
        // any transport thread.
        virtual void set_state_handler(StateHandler handler) = 0;
        virtual void set_candidate_handler(CandidateHandler handler) = 0;
        virtual void set_frame_handler(FrameHandler handler) = 0;

        // Throws NegotiationError when `sdp` cannot be parsed.
        virtual std::vector<MediaFormat> remote_formats(const std::string& sdp) const = 0;

        virtual bool add_track(const std::vector<MediaFormat>& formats, TrackDirection dir) = 0;
        virtual bool set_remote_description(const SessionDescription& desc) = 0;

        // Empty string on failure.
        virtual std::string create_offer() = 0;
        virtual std::string create_answer() = 0;

        virtual bool send_video(uint32_t duration, const uint8_t* data, size_t size) = 0;
        virtual bool send_audio(uint32_t duration, const uint8_t* data, size_t size) = 0;

        virtual void close(const std::string& reason) = 0;
    };
}
