#include <transport/gst_webrtc_transport.hpp>

#include <media/gst_codecs.hpp>
#include <transport/sdp_formats.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/app/gstappsrc.h>
#include <gst/sdp/sdp.h>
#include <gst/webrtc/webrtc.h>

#include <chrono>
#include <cstring>
#include <iostream>

namespace pv {
    namespace {
        struct DescriptionRequest {
            GstWebRtcTransport* self;
            SdpType type;
        };

        TransportState map_state(GstWebRTCPeerConnectionState s) {
            switch (s) {
                case GST_WEBRTC_PEER_CONNECTION_STATE_NEW: return TransportState::New;
                case GST_WEBRTC_PEER_CONNECTION_STATE_CONNECTING: return TransportState::Connecting;
                case GST_WEBRTC_PEER_CONNECTION_STATE_CONNECTED: return TransportState::Connected;
                case GST_WEBRTC_PEER_CONNECTION_STATE_DISCONNECTED: return TransportState::Disconnected;
                case GST_WEBRTC_PEER_CONNECTION_STATE_FAILED: return TransportState::Failed;
                case GST_WEBRTC_PEER_CONNECTION_STATE_CLOSED: return TransportState::Closed;
            }
            return TransportState::New;
        }

        void on_connection_state_notify(GstElement* webrtc, GParamSpec*, gpointer user_data) {
            GstWebRTCPeerConnectionState state = GST_WEBRTC_PEER_CONNECTION_STATE_NEW;
            g_object_get(webrtc, "connection-state", &state, nullptr);
            static_cast<GstWebRtcTransport*>(user_data)->on_connection_state(map_state(state));
        }

        void on_ice_gathering_state_notify(GstElement* webrtc, GParamSpec*, gpointer user_data) {
            GstWebRTCICEGatheringState state = GST_WEBRTC_ICE_GATHERING_STATE_NEW;
            g_object_get(webrtc, "ice-gathering-state", &state, nullptr);
            if (state == GST_WEBRTC_ICE_GATHERING_STATE_COMPLETE) {
                static_cast<GstWebRtcTransport*>(user_data)->on_gathering_complete();
            }
        }

        void on_ice_candidate_signal(GstElement*, guint mline_index, gchar* candidate, gpointer user_data) {
            static_cast<GstWebRtcTransport*>(user_data)->on_ice_candidate(mline_index, candidate ? candidate : "");
        }

        void on_pad_added(GstElement*, GstPad* pad, gpointer user_data) {
            static_cast<GstWebRtcTransport*>(user_data)->attach_receive_branch(pad);
        }

        GstFlowReturn on_rtp_sample(GstAppSink* sink, gpointer user_data) {
            auto* track = static_cast<GstWebRtcTransport::ReceiveTrack*>(user_data);

            GstSample* sample = gst_app_sink_pull_sample(sink);
            if (!sample) return GST_FLOW_OK;

            GstBuffer* buffer = gst_sample_get_buffer(sample);
            GstMapInfo map;
            if (buffer && gst_buffer_map(buffer, &map, GST_MAP_READ)) {
                const int64_t pts = GST_BUFFER_PTS_IS_VALID(buffer) ? static_cast<int64_t>(GST_BUFFER_PTS(buffer)) : 0;
                track->self->on_incoming_frame(track->kind, map.data, map.size, pts);
                gst_buffer_unmap(buffer, &map);
            }
            gst_sample_unref(sample);
            return GST_FLOW_OK;
        }

        void on_description_created(GstPromise* promise, gpointer user_data) {
            auto* req = static_cast<DescriptionRequest*>(user_data);
            GstWebRtcTransport* self = req->self;

            GstWebRTCSessionDescription* desc = nullptr;
            if (gst_promise_wait(promise) == GST_PROMISE_RESULT_REPLIED) {
                const GstStructure* reply = gst_promise_get_reply(promise);
                if (reply) {
                    gst_structure_get(reply, req->type == SdpType::Offer ? "offer" : "answer",
                                      GST_TYPE_WEBRTC_SESSION_DESCRIPTION, &desc, nullptr);
                }
            }

            if (desc && !self->closed()) {
                GstPromise* p = gst_promise_new();
                g_signal_emit_by_name(self->webrtcbin(), "set-local-description", desc, p);
                gst_promise_unref(p);
            }

            self->on_description(desc != nullptr);

            if (desc) gst_webrtc_session_description_free(desc);
            gst_promise_unref(promise);
        }
    }

    GstWebRtcTransport::GstWebRtcTransport(TransportConfig cfg, std::string session_id)
        : cfg_(std::move(cfg)), id_(std::move(session_id)) {}

    GstWebRtcTransport::~GstWebRtcTransport() {
        close("destroyed");
        release_();
    }

    bool GstWebRtcTransport::open() {
        ensure_gst_init();

        pipeline_ = gst_pipeline_new(("pv-" + id_).c_str());
        webrtc_ = gst_element_factory_make("webrtcbin", "webrtc");
        if (!pipeline_ || !webrtc_) {
            std::cerr << "[WebRTC] webrtcbin not available (gst-plugins-bad missing?)\n";
            if (webrtc_) gst_object_unref(gst_object_ref_sink(webrtc_));
            webrtc_ = nullptr;
            release_();
            return false;
        }
        gst_object_ref(webrtc_);
        gst_bin_add(GST_BIN(pipeline_), webrtc_);

        g_object_set(webrtc_, "bundle-policy", GST_WEBRTC_BUNDLE_POLICY_MAX_BUNDLE, nullptr);
        if (!cfg_.stun_server.empty()) {
            g_object_set(webrtc_, "stun-server", cfg_.stun_server.c_str(), nullptr);
        }

        g_signal_connect(webrtc_, "notify::connection-state", G_CALLBACK(on_connection_state_notify), this);
        g_signal_connect(webrtc_, "notify::ice-gathering-state", G_CALLBACK(on_ice_gathering_state_notify), this);
        g_signal_connect(webrtc_, "on-ice-candidate", G_CALLBACK(on_ice_candidate_signal), this);
        g_signal_connect(webrtc_, "pad-added", G_CALLBACK(on_pad_added), this);

        auto ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[WebRTC] Failed to set pipeline to PLAYING\n";
            disconnect_signals_();
            release_();
            return false;
        }
        return true;
    }

    void GstWebRtcTransport::set_state_handler(StateHandler handler) {
        std::lock_guard lk(handler_mtx_);
        on_state_ = std::move(handler);
    }

    void GstWebRtcTransport::set_candidate_handler(CandidateHandler handler) {
        std::lock_guard lk(handler_mtx_);
        on_candidate_ = std::move(handler);
    }

    void GstWebRtcTransport::set_frame_handler(FrameHandler handler) {
        std::lock_guard lk(handler_mtx_);
        on_frame_ = std::move(handler);
    }

    std::vector<MediaFormat> GstWebRtcTransport::remote_formats(const std::string& sdp) const {
        return parse_sdp_formats(sdp);
    }

    bool GstWebRtcTransport::add_track(const std::vector<MediaFormat>& formats, TrackDirection dir) {
        if (closed_ || !webrtc_ || formats.empty()) return false;
        try {
            if (dir == TrackDirection::SendOnly) return add_send_track_(formats.front());
            return add_recv_transceiver_(formats);
        } catch (const std::exception& e) {
            std::cerr << "[WebRTC] add_track: " << e.what() << "\n";
            return false;
        }
    }

    bool GstWebRtcTransport::add_send_track_(const MediaFormat& f) {
        const CodecElements el = codec_elements(f.codec);
        const std::string desc =
            "appsrc name=src is-live=true format=time do-timestamp=true caps=\"" + el.encoded_caps + "\" "
            "! queue ! " + el.payloader + " pt=" + std::to_string(f.payload_type) + " "
            "! " + rtp_caps(f);

        GError* err = nullptr;
        GstElement* bin = gst_parse_bin_from_description(desc.c_str(), TRUE, &err);
        if (!bin) {
            std::cerr << "[WebRTC] Failed to create send branch";
            if (err) {
                std::cerr << ": " << err->message;
                g_error_free(err);
            }
            std::cerr << "\n";
            return false;
        }
        if (err) g_error_free(err);

        gst_bin_add(GST_BIN(pipeline_), bin);
        if (!gst_element_link(bin, webrtc_)) {
            std::cerr << "[WebRTC] Failed to link " << to_string(f.codec) << " branch to webrtcbin\n";
            gst_element_set_state(bin, GST_STATE_NULL);
            gst_bin_remove(GST_BIN(pipeline_), bin);
            return false;
        }
        gst_element_sync_state_with_parent(bin);

        std::lock_guard lk(send_mtx_);
        SendTrack& track = f.kind == MediaKind::Audio ? audio_ : video_;
        if (track.appsrc) gst_object_unref(track.appsrc);
        track.appsrc = gst_bin_get_by_name(GST_BIN(bin), "src");
        track.clock_rate = f.clock_rate;
        return track.appsrc != nullptr;
    }

    bool GstWebRtcTransport::add_recv_transceiver_(const std::vector<MediaFormat>& formats) {
        std::string caps_str;
        for (const auto& f : formats) {
            if (!caps_str.empty()) caps_str += ";";
            caps_str += rtp_caps(f);
        }

        GstCaps* caps = gst_caps_from_string(caps_str.c_str());
        if (!caps) {
            std::cerr << "[WebRTC] Bad transceiver caps: " << caps_str << "\n";
            return false;
        }

        GstWebRTCRTPTransceiver* trans = nullptr;
        g_signal_emit_by_name(webrtc_, "add-transceiver",
                              GST_WEBRTC_RTP_TRANSCEIVER_DIRECTION_RECVONLY, caps, &trans);
        gst_caps_unref(caps);
        if (!trans) {
            std::cerr << "[WebRTC] add-transceiver failed\n";
            return false;
        }
        gst_object_unref(trans);
        return true;
    }

    bool GstWebRtcTransport::set_remote_description(const SessionDescription& desc) {
        if (closed_ || !webrtc_) return false;

        GstSDPMessage* sdp = nullptr;
        gst_sdp_message_new(&sdp);
        if (gst_sdp_message_parse_buffer(
                reinterpret_cast<const guint8*>(desc.sdp.data()),
                desc.sdp.size(), sdp) != GST_SDP_OK) {
            std::cerr << "[WebRTC] Failed to parse SDP message.\n";
            gst_sdp_message_free(sdp);
            return false;
        }

        GstWebRTCSessionDescription* remote = gst_webrtc_session_description_new(
            desc.type == SdpType::Offer ? GST_WEBRTC_SDP_TYPE_OFFER : GST_WEBRTC_SDP_TYPE_ANSWER, sdp);

        GstPromise* p = gst_promise_new();
        g_signal_emit_by_name(webrtc_, "set-remote-description", remote, p);

        bool ok = gst_promise_wait(p) == GST_PROMISE_RESULT_REPLIED;
        if (ok) {
            const GstStructure* reply = gst_promise_get_reply(p);
            if (reply && gst_structure_has_field(reply, "error")) {
                GError* e = nullptr;
                gst_structure_get(reply, "error", G_TYPE_ERROR, &e, nullptr);
                std::cerr << "[WebRTC] set-remote-description: " << (e ? e->message : "unknown error") << "\n";
                g_clear_error(&e);
                ok = false;
            }
        }

        gst_promise_unref(p);
        gst_webrtc_session_description_free(remote);
        return ok;
    }

    std::string GstWebRtcTransport::create_offer() {
        return create_description_(SdpType::Offer);
    }

    std::string GstWebRtcTransport::create_answer() {
        return create_description_(SdpType::Answer);
    }

    std::string GstWebRtcTransport::create_description_(SdpType type) {
        if (closed_ || !webrtc_) return "";
        const char* what = type == SdpType::Offer ? "offer" : "answer";

        {
            std::lock_guard lk(sdp_mtx_);
            description_ready_ = false;
            description_ok_ = false;
        }

        GstPromise* promise = gst_promise_new_with_change_func(
            on_description_created,
            new DescriptionRequest{this, type},
            [](gpointer data) { delete static_cast<DescriptionRequest*>(data); });
        g_signal_emit_by_name(webrtc_, type == SdpType::Offer ? "create-offer" : "create-answer", nullptr, promise);

        {
            std::unique_lock lk(sdp_mtx_);
            bool success = sdp_cv_.wait_for(lk, std::chrono::milliseconds(cfg_.sdp_timeout_ms),
                                            [&] { return description_ready_ || closed_; });
            if (!success || closed_) {
                std::cerr << "[WebRTC] Timeout waiting for the " << what << ".\n";
                return "";
            }
            if (!description_ok_) {
                std::cerr << "[WebRTC] webrtcbin produced no " << what << ".\n";
                return "";
            }

            bool gathered = sdp_cv_.wait_for(lk, std::chrono::milliseconds(cfg_.ice_gather_timeout_ms),
                                             [&] { return gathering_complete_ || closed_; });
            if (closed_) return "";
            if (!gathered) {
                std::cerr << "[WebRTC] ICE gathering not complete after " << cfg_.ice_gather_timeout_ms
                          << " ms, using candidates gathered so far\n";
            }
        }

        return local_description_text_();
    }

    std::string GstWebRtcTransport::local_description_text_() {
        GstWebRTCSessionDescription* desc = nullptr;
        g_object_get(webrtc_, "local-description", &desc, nullptr);
        if (!desc) return "";

        gchar* sdp_str = gst_sdp_message_as_text(desc->sdp);
        std::string out = sdp_str ? sdp_str : "";
        if (sdp_str) g_free(sdp_str);
        gst_webrtc_session_description_free(desc);
        return out;
    }

    bool GstWebRtcTransport::send_video(uint32_t duration, const uint8_t* data, size_t size) {
        std::lock_guard lk(send_mtx_);
        if (closed_) return false;
        return push_(video_, duration, data, size);
    }

    bool GstWebRtcTransport::send_audio(uint32_t duration, const uint8_t* data, size_t size) {
        std::lock_guard lk(send_mtx_);
        if (closed_) return false;
        return push_(audio_, duration, data, size);
    }

    bool GstWebRtcTransport::push_(SendTrack& track, uint32_t duration, const uint8_t* data, size_t size) {
        if (!track.appsrc || !data || size == 0) return false;

        GstBuffer* buf = gst_buffer_new_allocate(nullptr, size, nullptr);
        GstMapInfo map;
        if (!gst_buffer_map(buf, &map, GST_MAP_WRITE)) {
            gst_buffer_unref(buf);
            return false;
        }
        std::memcpy(map.data, data, size);
        gst_buffer_unmap(buf, &map);

        GST_BUFFER_DURATION(buf) = gst_util_uint64_scale(duration, GST_SECOND, track.clock_rate);

        GstFlowReturn ret = gst_app_src_push_buffer(GST_APP_SRC(track.appsrc), buf);
        if (ret != GST_FLOW_OK) {
            std::cerr << "[WebRTC] Failed to push buffer to stream. ret: " << ret << "\n";
            return false;
        }
        return true;
    }

    void GstWebRtcTransport::attach_receive_branch(GstPad* pad) {
        if (closed_ || GST_PAD_DIRECTION(pad) != GST_PAD_SRC) return;

        GstCaps* caps = gst_pad_get_current_caps(pad);
        if (!caps) caps = gst_pad_query_caps(pad, nullptr);

        std::string media, encoding;
        if (caps && !gst_caps_is_empty(caps)) {
            const GstStructure* st = gst_caps_get_structure(caps, 0);
            if (const gchar* m = gst_structure_get_string(st, "media")) media = m;
            if (const gchar* e = gst_structure_get_string(st, "encoding-name")) encoding = e;
        }
        if (caps) gst_caps_unref(caps);

        const Codec codec = codec_from_str(encoding);
        const MediaKind kind = media == "audio" ? MediaKind::Audio : MediaKind::Video;

        std::string desc;
        if (codec != Codec::Unknown) {
            const CodecElements el = codec_elements(codec);
            desc = "queue ! " + el.depayloader + " ! " + el.encoded_caps +
                   " ! appsink name=rtpsink emit-signals=true sync=false max-buffers=8 drop=true";
        } else {
            std::cerr << "[WebRTC] Unsupported incoming " << media << " stream '" << encoding << "', discarding\n";
            desc = "queue ! fakesink sync=false";
        }

        GError* err = nullptr;
        GstElement* bin = gst_parse_bin_from_description(desc.c_str(), TRUE, &err);
        if (!bin) {
            std::cerr << "[WebRTC] Failed to create receive branch";
            if (err) {
                std::cerr << ": " << err->message;
                g_error_free(err);
            }
            std::cerr << "\n";
            return;
        }
        if (err) g_error_free(err);

        if (codec != Codec::Unknown) {
            auto track = std::make_unique<ReceiveTrack>();
            track->self = this;
            track->kind = kind;
            track->appsink = gst_bin_get_by_name(GST_BIN(bin), "rtpsink");
            g_signal_connect(track->appsink, "new-sample", G_CALLBACK(on_rtp_sample), track.get());

            std::lock_guard lk(recv_mtx_);
            recv_tracks_.push_back(std::move(track));
        }

        gst_bin_add(GST_BIN(pipeline_), bin);
        gst_element_sync_state_with_parent(bin);

        GstPad* sinkpad = gst_element_get_static_pad(bin, "sink");
        if (gst_pad_link(pad, sinkpad) != GST_PAD_LINK_OK) {
            std::cerr << "[WebRTC] Failed to link incoming " << media << " stream\n";
        } else {
            std::cout << "[WebRTC:" << id_ << "] receiving " << media << " " << encoding << "\n";
        }
        gst_object_unref(sinkpad);
    }

    void GstWebRtcTransport::on_connection_state(TransportState state) {
        if (closed_) return;
        std::cout << "[WebRTC:" << id_ << "] connection state " << to_string(state) << "\n";

        StateHandler h;
        {
            std::lock_guard lk(handler_mtx_);
            h = on_state_;
        }
        if (!h) return;
        try {
            h(state);
        } catch (const std::exception& e) {
            std::cerr << "[WebRTC:" << id_ << "] state handler threw: " << e.what() << "\n";
        }
    }

    void GstWebRtcTransport::on_ice_candidate(unsigned mline_index, const std::string& candidate) {
        if (closed_) return;

        CandidateHandler h;
        {
            std::lock_guard lk(handler_mtx_);
            h = on_candidate_;
        }
        if (!h) return;
        try {
            h(IceCandidate{mline_index, candidate});
        } catch (const std::exception& e) {
            std::cerr << "[WebRTC:" << id_ << "] candidate handler threw: " << e.what() << "\n";
        }
    }

    void GstWebRtcTransport::on_gathering_complete() {
        {
            std::lock_guard lk(sdp_mtx_);
            gathering_complete_ = true;
        }
        sdp_cv_.notify_all();
    }

    void GstWebRtcTransport::on_description(bool ok) {
        {
            std::lock_guard lk(sdp_mtx_);
            description_ready_ = true;
            description_ok_ = ok;
        }
        sdp_cv_.notify_all();
    }

    void GstWebRtcTransport::on_incoming_frame(MediaKind kind, const uint8_t* data, size_t size, int64_t pts_ns) {
        if (closed_) return;

        FrameHandler h;
        {
            std::lock_guard lk(handler_mtx_);
            h = on_frame_;
        }
        if (!h) return;
        try {
            h(kind, data, size, pts_ns);
        } catch (const std::exception& e) {
            std::cerr << "[WebRTC:" << id_ << "] frame handler threw: " << e.what() << "\n";
        }
    }

    void GstWebRtcTransport::disconnect_signals_() {
        if (webrtc_) g_signal_handlers_disconnect_by_data(webrtc_, this);

        std::lock_guard lk(recv_mtx_);
        for (auto& t : recv_tracks_) {
            if (t->appsink) g_signal_handlers_disconnect_by_data(t->appsink, t.get());
        }
    }

    void GstWebRtcTransport::close(const std::string& reason) {
        bool expected = false;
        if (!closed_.compare_exchange_strong(expected, true)) return;

        std::cout << "[WebRTC:" << id_ << "] closing (" << reason << ")\n";
        disconnect_signals_();

        {
            std::lock_guard lk(send_mtx_);
            if (video_.appsrc) gst_app_src_end_of_stream(GST_APP_SRC(video_.appsrc));
            if (audio_.appsrc) gst_app_src_end_of_stream(GST_APP_SRC(audio_.appsrc));
        }

        // Wake a pending create_offer()/create_answer().
        {
            std::lock_guard lk(sdp_mtx_);
        }
        sdp_cv_.notify_all();

        // May run on a webrtcbin thread; the state change must not block it.
        if (pipeline_) {
            gst_element_call_async(pipeline_,
                                   [](GstElement* e, gpointer) { gst_element_set_state(e, GST_STATE_NULL); },
                                   nullptr, nullptr);
        }
    }

    void GstWebRtcTransport::release_() {
        if (pipeline_) gst_element_set_state(pipeline_, GST_STATE_NULL);

        {
            std::lock_guard lk(send_mtx_);
            if (video_.appsrc) {
                gst_object_unref(video_.appsrc);
                video_.appsrc = nullptr;
            }
            if (audio_.appsrc) {
                gst_object_unref(audio_.appsrc);
                audio_.appsrc = nullptr;
            }
        }
        {
            std::lock_guard lk(recv_mtx_);
            for (auto& t : recv_tracks_) {
                if (t->appsink) gst_object_unref(t->appsink);
            }
            recv_tracks_.clear();
        }
        if (webrtc_) {
            gst_object_unref(webrtc_);
            webrtc_ = nullptr;
        }
        if (pipeline_) {
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }
}
