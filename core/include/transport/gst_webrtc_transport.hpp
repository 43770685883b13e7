#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <common/config.hpp>
#include <transport/peer_transport.hpp>

struct _GstElement;
using GstElement = _GstElement;
struct _GstPad;
using GstPad = _GstPad;

namespace pv {
    // One webrtcbin per session. Send tracks are appsrc ! payloader bins linked to
    // webrtcbin request pads; receive tracks are depayloader ! appsink bins attached
    // on pad-added. ICE is not trickled: descriptions are returned once gathering
    // completes (or the gather timeout expires).
    class GstWebRtcTransport : public IPeerTransport {
    public:
        GstWebRtcTransport(TransportConfig cfg, std::string session_id);
        ~GstWebRtcTransport() override;

        bool open();

        void set_state_handler(StateHandler handler) override;
        void set_candidate_handler(CandidateHandler handler) override;
        void set_frame_handler(FrameHandler handler) override;

        std::vector<MediaFormat> remote_formats(const std::string& sdp) const override;

        bool add_track(const std::vector<MediaFormat>& formats, TrackDirection dir) override;
        bool set_remote_description(const SessionDescription& desc) override;

        std::string create_offer() override;
        std::string create_answer() override;

        bool send_video(uint32_t duration, const uint8_t* data, size_t size) override;
        bool send_audio(uint32_t duration, const uint8_t* data, size_t size) override;

        void close(const std::string& reason) override;

        struct SendTrack {
            GstElement* appsrc = nullptr;
            int clock_rate = 90000;
        };

        struct ReceiveTrack {
            GstWebRtcTransport* self = nullptr;
            MediaKind kind = MediaKind::Video;
            GstElement* appsink = nullptr;
        };

        // Invoked from GStreamer threads.
        void on_connection_state(TransportState state);
        void on_ice_candidate(unsigned mline_index, const std::string& candidate);
        void on_gathering_complete();
        void on_description(bool ok);
        void on_incoming_frame(MediaKind kind, const uint8_t* data, size_t size, int64_t pts_ns);
        void attach_receive_branch(GstPad* webrtc_pad);

        GstElement* webrtcbin() const { return webrtc_; }
        bool closed() const { return closed_; }

    private:
        bool add_send_track_(const MediaFormat& format);
        bool add_recv_transceiver_(const std::vector<MediaFormat>& formats);
        std::string create_description_(SdpType type);
        std::string local_description_text_();
        bool push_(SendTrack& track, uint32_t duration, const uint8_t* data, size_t size);
        void disconnect_signals_();
        void release_();

        TransportConfig cfg_;
        std::string id_;

        GstElement* pipeline_ = nullptr;
        GstElement* webrtc_ = nullptr;

        std::mutex handler_mtx_;
        StateHandler on_state_;
        CandidateHandler on_candidate_;
        FrameHandler on_frame_;

        std::mutex send_mtx_;
        SendTrack video_;
        SendTrack audio_;

        std::mutex recv_mtx_;
        std::vector<std::unique_ptr<ReceiveTrack>> recv_tracks_;

        std::mutex sdp_mtx_;
        std::condition_variable sdp_cv_;
        bool description_ready_ = false;
        bool description_ok_ = false;
        bool gathering_complete_ = false;

        std::atomic<bool> closed_{false};
    };
}
