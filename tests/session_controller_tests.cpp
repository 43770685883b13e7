#include "fakes.hpp"

#include <common/errors.hpp>
#include <session/session_controller.hpp>
#include <session/session_state.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    using pv::SessionState;
    using pv::test::FakeMediaSink;
    using pv::test::FakeMediaSource;
    using pv::test::FakeTransport;

    struct Sender {
        FakeTransport* transport = nullptr;
        FakeMediaSource* source = nullptr;
        std::unique_ptr<pv::SessionController> session;
    };

    Sender make_sender(std::vector<pv::Codec> codecs, bool audio = false) {
        std::vector<pv::MediaFormat> formats;
        for (auto c : codecs) formats.push_back(pv::default_format(c));
        if (audio) formats.push_back(pv::default_format(pv::Codec::Opus));

        auto transport = std::make_unique<FakeTransport>();
        auto source = std::make_unique<FakeMediaSource>(formats, audio);
        Sender s;
        s.transport = transport.get();
        s.source = source.get();
        s.session = pv::SessionController::make_sender("s1", std::move(transport), std::move(source));
        return s;
    }

    struct Receiver {
        FakeTransport* transport = nullptr;
        FakeMediaSink* sink = nullptr;
        std::unique_ptr<pv::SessionController> session;
    };

    Receiver make_receiver(pv::Codec codec) {
        auto transport = std::make_unique<FakeTransport>();
        auto sink = std::make_unique<FakeMediaSink>(std::vector<pv::MediaFormat>{pv::default_format(codec)});
        Receiver r;
        r.transport = transport.get();
        r.sink = sink.get();
        r.session = pv::SessionController::make_receiver("r1", std::move(transport), std::move(sink));
        return r;
    }

    void test_transition_table() {
        const SessionState all[] = {SessionState::Negotiating, SessionState::Connecting, SessionState::Active,
                                    SessionState::Closing, SessionState::Closed, SessionState::Failed};
        auto allowed = [](SessionState a, SessionState b) {
            switch (a) {
                case SessionState::Negotiating:
                    return b == SessionState::Connecting || b == SessionState::Failed || b == SessionState::Closing;
                case SessionState::Connecting:
                    return b == SessionState::Active || b == SessionState::Failed || b == SessionState::Closing;
                case SessionState::Active:
                    return b == SessionState::Failed || b == SessionState::Closing;
                case SessionState::Failed:
                    return b == SessionState::Closing;
                case SessionState::Closing:
                    return b == SessionState::Closed;
                case SessionState::Closed:
                    return false;
            }
            return false;
        };

        for (auto a : all) {
            for (auto b : all) {
                check(pv::can_transition(a, b) == allowed(a, b),
                      std::string("can_transition ") + pv::to_string(a) + " -> " + pv::to_string(b));
            }
        }
        check(!pv::can_transition(SessionState::Active, SessionState::Connecting), "Active must not regress");
        check(pv::is_terminal(SessionState::Closing) && pv::is_terminal(SessionState::Closed), "terminal states");
        check(!pv::is_terminal(SessionState::Failed), "Failed still has to go through Closing");
    }

    void test_vp8_end_to_end_single_start() {
        auto s = make_sender({pv::Codec::VP8});
        check(s.session->state() == SessionState::Negotiating, "sessions start negotiating");

        const std::string answer = s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        check(answer == "answer VP8", "answer should carry the negotiated VP8 track");
        check(s.session->state() == SessionState::Connecting, "successful negotiation moves to Connecting");
        check(s.session->selected_format() && s.session->selected_format()->codec == pv::Codec::VP8,
              "VP8 should be selected");

        const auto tracks = s.transport->tracks_copy();
        check(tracks.size() == 1 && tracks[0].dir == pv::TrackDirection::SendOnly, "one send-only track expected");
        check(s.transport->remote.type == pv::SdpType::Offer, "remote offer should be applied");

        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] { s.session->on_transport_state(pv::TransportState::Connected); });
        }
        for (auto& t : threads) t.join();
        s.transport->fire_state(pv::TransportState::Connected);

        check(s.session->state() == SessionState::Active, "Connected should activate the session");
        check(s.source->starts == 1, "media should start exactly once for duplicate Connected events");

        s.source->emit_sample(pv::MediaKind::Video, {1, 2, 3});
        s.source->emit_sample(pv::MediaKind::Video, {4, 5, 6});
        check(s.transport->video_sends == 2, "encoded samples should reach send_video");

        s.transport->fire_state(pv::TransportState::Connecting);
        check(s.session->state() == SessionState::Active, "Active must not regress to Connecting");

        s.session->close("done");
        check(s.session->state() == SessionState::Closed, "close should end in Closed");
        check(!s.session->failed(), "explicit close is not a failure");
        check(s.source->stops == 1, "media should be stopped once");
        check(s.transport->close_calls == 1, "transport should be closed once");
    }

    void test_disjoint_codecs_fail_negotiation() {
        auto s = make_sender({pv::Codec::VP8});

        bool format_error = false;
        try {
            s.session->begin_negotiation({pv::SdpType::Offer, "offer H264"});
        } catch (const pv::FormatError&) {
            format_error = true;
        }
        check(format_error, "VP8-only source against an H264 offer should raise FormatError");
        check(s.session->state() == SessionState::Closed, "failed negotiation should end in Closed");
        check(s.session->failed(), "failed negotiation is a failure");
        check(s.session->close_reason() == "format-error", "close reason should name the format error");
        check(s.transport->video_sends == 0, "no media may be sent");
        check(s.transport->tracks_copy().empty(), "no track may be added");
        check(s.source->starts == 0, "media must never start");
        check(s.transport->close_calls == 1, "transport should be closed");

        s.session->on_transport_state(pv::TransportState::Connected);
        check(s.source->starts == 0, "Connected after teardown must not start media");
    }

    void test_malformed_offer() {
        auto s = make_sender({pv::Codec::VP8});
        bool negotiation_error = false;
        try {
            s.session->begin_negotiation({pv::SdpType::Offer, "!garbage"});
        } catch (const pv::NegotiationError&) {
            negotiation_error = true;
        }
        check(negotiation_error, "unparsable offer should raise NegotiationError");
        check(s.session->state() == SessionState::Closed, "unparsable offer should close the session");

        auto empty = make_sender({pv::Codec::VP8});
        bool threw = false;
        try {
            empty.session->begin_negotiation({pv::SdpType::Offer, ""});
        } catch (const pv::NegotiationError&) {
            threw = true;
        }
        check(threw, "empty offer should raise NegotiationError");
    }

    void test_answer_failure_tears_down() {
        auto s = make_sender({pv::Codec::VP8});
        s.transport->fail_answer = true;
        bool threw = false;
        try {
            s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        } catch (const pv::NegotiationError&) {
            threw = true;
        }
        check(threw, "answer creation failure should raise NegotiationError");
        check(s.session->state() == SessionState::Closed, "answer creation failure should close the session");
    }

    void test_negotiation_outside_negotiating() {
        auto s = make_sender({pv::Codec::VP8});
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});

        bool threw = false;
        try {
            s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        } catch (const pv::NegotiationError&) {
            threw = true;
        }
        check(threw, "second negotiation should be refused");
        check(s.session->state() == SessionState::Connecting, "a refused renegotiation must not tear down");
        check(s.transport->close_calls == 0, "transport must stay open");
    }

    void test_audio_is_negotiated_when_offered() {
        auto s = make_sender({pv::Codec::H264}, true);
        const std::string answer = s.session->begin_negotiation({pv::SdpType::Offer, "offer H264 OPUS"});
        check(answer == "answer H264 OPUS", "audio track should be added when both sides have Opus");

        s.session->on_transport_state(pv::TransportState::Connected);
        s.source->emit_sample(pv::MediaKind::Audio, {1});
        check(s.transport->audio_sends == 1, "audio samples should go to send_audio");

        auto v = make_sender({pv::Codec::H264}, true);
        check(v.session->begin_negotiation({pv::SdpType::Offer, "offer H264"}) == "answer H264",
              "video-only offers should still be answered");
    }

    void test_concurrent_close_is_idempotent() {
        auto s = make_sender({pv::Codec::VP8});
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        s.session->on_transport_state(pv::TransportState::Connected);

        std::atomic<int> closed_calls{0};
        s.session->set_closed_handler([&](const std::string&) { ++closed_calls; });

        std::atomic<bool> go{false};
        std::vector<std::thread> threads;
        for (int i = 0; i < 16; ++i) {
            threads.emplace_back([&, i] {
                while (!go) std::this_thread::yield();
                if (i % 4 == 0) s.session->on_transport_state(pv::TransportState::Failed);
                else if (i % 4 == 1) s.session->on_transport_state(pv::TransportState::Closed);
                else s.session->close("close-" + std::to_string(i));
            });
        }
        go = true;
        for (auto& t : threads) t.join();

        check(s.session->wait_closed(std::chrono::milliseconds(1000)), "session should finish closing");
        check(s.session->state() == SessionState::Closed, "all shutdown paths end in Closed");
        check(closed_calls == 1, "closed handler should fire exactly once");
        check(s.transport->close_calls == 1, "transport close should run exactly once");
        check(s.source->stops == 1, "media stop should run exactly once");

        s.session->close("again");
        check(closed_calls == 1, "closing a closed session does nothing");

        std::atomic<int> late{0};
        s.session->set_closed_handler([&](const std::string&) { ++late; });
        check(late == 1, "a handler installed after Closed should run immediately");
    }

    void test_transport_failure() {
        auto s = make_sender({pv::Codec::VP8});
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        s.session->on_transport_state(pv::TransportState::Connected);

        s.transport->fire_state(pv::TransportState::Failed);
        check(s.session->state() == SessionState::Closed, "transport failure should close the session");
        check(s.session->failed(), "transport failure is a failure");
        check(s.session->close_reason() == "pc-failed", "close reason should name the failure");

        auto d = make_sender({pv::Codec::VP8});
        d.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        d.transport->fire_state(pv::TransportState::Disconnected);
        check(d.session->state() == SessionState::Closed, "disconnect while connecting should close");
        check(d.session->failed(), "disconnect counts as a failure");
        check(d.source->starts == 0, "media never started");
    }

    void test_media_events_drive_teardown() {
        auto s = make_sender({pv::Codec::VP8});
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        s.session->on_transport_state(pv::TransportState::Connected);
        s.source->emit_ended();
        check(s.session->state() == SessionState::Closed, "end of stream should close the session");
        check(s.session->close_reason() == "video-source-stopped", "end of stream reason");
        check(!s.session->failed(), "end of stream is not a failure");

        auto e = make_sender({pv::Codec::VP8});
        e.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        e.session->on_transport_state(pv::TransportState::Connected);
        e.source->emit_error("demux error");
        check(e.session->state() == SessionState::Closed, "media error should close the session");
        check(e.session->failed(), "media error is a failure");
        check(e.session->close_reason() == "media-error: demux error", "media error reason");
    }

    void test_media_start_failure() {
        auto s = make_sender({pv::Codec::VP8});
        s.source->start_result = false;
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        s.session->on_transport_state(pv::TransportState::Connected);
        check(s.session->state() == SessionState::Closed, "media start failure should close the session");
        check(s.session->failed(), "media start failure is a failure");
        check(s.session->close_reason() == "media-start-failed", "media start failure reason");
    }

    void test_stop_exception_is_swallowed() {
        auto s = make_sender({pv::Codec::VP8});
        s.source->throw_on_stop = true;
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        s.session->on_transport_state(pv::TransportState::Connected);

        s.session->close("bye");
        check(s.session->state() == SessionState::Closed, "a throwing media stop must not block teardown");
        check(s.transport->close_calls == 1, "transport should still be closed");
    }

    void test_post_teardown_injection() {
        auto s = make_sender({pv::Codec::VP8});
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        s.session->on_transport_state(pv::TransportState::Connected);
        s.source->emit_sample(pv::MediaKind::Video, {1});
        s.session->close("bye");

        std::vector<uint8_t> payload = {7, 7, 7};
        s.source->stale_sample_sink->on_encoded_sample(pv::MediaKind::Video, 3000, payload.data(), payload.size());
        s.source->stale_event_sink->on_media_error("late error");
        s.source->emit_sample(pv::MediaKind::Video, payload);
        s.transport->fire_state(pv::TransportState::Connected);

        check(s.transport->video_sends == 1, "nothing may be sent after teardown");
        check(s.session->close_reason() == "bye", "late events must not rewrite the close reason");
        check(s.source->starts == 1, "late Connected must not restart media");

        auto r = make_receiver(pv::Codec::VP8);
        r.session->create_offer();
        r.session->begin_negotiation({pv::SdpType::Answer, "answer VP8"});
        r.session->on_transport_state(pv::TransportState::Connected);
        r.session->close("bye");

        auto px = pv::test::bgr_pixels(4, 2, 9);
        r.sink->stale_frame_sink->on_raw_frame(pv::test::raw_view(px, 4, 2, pv::PixelFormat::Bgr));
        r.transport->fire_frame(pv::MediaKind::Video, {0, 0, 1});
        check(!r.session->frame_buffer().pending(), "frames after teardown must not be published");
        check(r.sink->pushed == 0, "encoded frames after teardown must not reach the decoder");
    }

    void test_receiver_flow() {
        auto r = make_receiver(pv::Codec::H264);

        bool threw = false;
        try {
            r.session->begin_negotiation({pv::SdpType::Answer, "answer H264"});
        } catch (const pv::NegotiationError&) {
            threw = true;
        }
        check(threw, "an answer without a local offer should be refused");
        check(r.session->state() == SessionState::Closed, "an answer without an offer closes the session");

        auto ok = make_receiver(pv::Codec::H264);
        const std::string offer = ok.session->create_offer();
        check(!offer.empty(), "offer should be produced");
        const auto tracks = ok.transport->tracks_copy();
        check(tracks.size() == 1 && tracks[0].dir == pv::TrackDirection::RecvOnly, "one receive-only track expected");

        check(ok.session->begin_negotiation({pv::SdpType::Answer, "answer H264"}).empty(),
              "applying an answer returns no text");
        check(ok.session->state() == SessionState::Connecting, "answer moves the session to Connecting");
        check(ok.transport->remote.type == pv::SdpType::Answer, "remote answer should be applied");

        ok.transport->fire_candidate("candidate:1 1 UDP 2122252543 192.168.1.2 50000 typ host");
        ok.transport->fire_state(pv::TransportState::Connected);
        check(ok.sink->starts == 1, "decoder should start on Connected");

        ok.transport->fire_frame(pv::MediaKind::Video, {0, 0, 0, 1, 0x65});
        check(ok.sink->pushed == 1, "depayloaded frames should reach the decoder");

        auto px = pv::test::bgr_pixels(4, 2, 50);
        ok.sink->emit_frame(pv::test::raw_view(px, 4, 2, pv::PixelFormat::Bgr));
        check(ok.session->frame_buffer().pending(), "decoded frames should land in the frame buffer");

        ok.session->close("bye");
        check(!ok.session->frame_buffer().pending(), "teardown should clear the frame buffer");
        check(ok.sink->stops == 1, "decoder should be stopped");
    }

    void test_receiver_format_mismatch() {
        auto r = make_receiver(pv::Codec::H264);
        r.session->create_offer();
        bool format_error = false;
        try {
            r.session->begin_negotiation({pv::SdpType::Answer, "answer VP8"});
        } catch (const pv::FormatError&) {
            format_error = true;
        }
        check(format_error, "answer without the offered codec should raise FormatError");
        check(r.session->state() == SessionState::Closed, "format mismatch closes the receiver");
    }

    void test_connected_while_answer_is_applied() {
        auto r = make_receiver(pv::Codec::VP8);
        r.session->create_offer();

        std::thread notifier;
        r.transport->on_set_remote = [&] {
            notifier = std::thread([&] { r.transport->fire_state(pv::TransportState::Connected); });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        };
        r.session->begin_negotiation({pv::SdpType::Answer, "answer VP8"});
        if (notifier.joinable()) notifier.join();

        check(r.session->state() == SessionState::Active, "Connected during answer apply should activate");
        check(r.sink->starts == 1, "decoder should start for a Connected racing the answer");

        auto s = make_sender({pv::Codec::VP8});
        std::thread sender_notifier;
        s.transport->on_set_remote = [&] {
            sender_notifier = std::thread([&] { s.transport->fire_state(pv::TransportState::Connected); });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        };
        s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        if (sender_notifier.joinable()) sender_notifier.join();

        check(s.session->state() == SessionState::Active, "Connected during offer apply should activate");
        check(s.source->starts == 1, "source should start for a Connected racing the offer");
    }

    void test_connected_then_negotiation_fails() {
        auto s = make_sender({pv::Codec::VP8});
        s.transport->fail_answer = true;
        std::thread notifier;
        s.transport->on_set_remote = [&] {
            notifier = std::thread([&] { s.transport->fire_state(pv::TransportState::Connected); });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        };

        bool threw = false;
        try {
            s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        } catch (const pv::NegotiationError&) {
            threw = true;
        }
        if (notifier.joinable()) notifier.join();

        check(threw, "answer failure should still be reported");
        check(s.source->starts == 0, "a failed negotiation must not start media");
        check(s.session->state() == SessionState::Closed, "a failed negotiation ends in Closed");
    }

    void test_receiver_answers_remote_offer() {
        auto r = make_receiver(pv::Codec::VP8);
        const std::string answer = r.session->begin_negotiation({pv::SdpType::Offer, "offer H264 VP8"});

        check(answer == "answer VP8", "receiver should answer with its decoder format");
        const auto tracks = r.transport->tracks_copy();
        check(tracks.size() == 1 && tracks[0].dir == pv::TrackDirection::RecvOnly,
              "answering receiver adds one receive-only track");
        check(r.transport->remote.type == pv::SdpType::Offer, "remote offer should be applied");
        check(r.sink->selected_formats().size() == 1 && r.sink->selected_formats()[0].codec == pv::Codec::VP8,
              "decoder should be told the negotiated format");
        check(r.session->state() == SessionState::Connecting, "answering moves to Connecting");

        r.transport->fire_state(pv::TransportState::Connected);
        r.transport->fire_frame(pv::MediaKind::Video, {0x10, 0x02, 0x00});
        check(r.sink->starts == 1 && r.sink->pushed == 1, "received frames reach the decoder");

        auto mismatch = make_receiver(pv::Codec::H264);
        bool format_error = false;
        try {
            mismatch.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        } catch (const pv::FormatError&) {
            format_error = true;
        }
        check(format_error, "an offer without the decoder codec should raise FormatError");
        check(mismatch.transport->tracks_copy().empty(), "no track for a rejected offer");

        auto glare = make_receiver(pv::Codec::VP8);
        glare.session->create_offer();
        bool threw = false;
        try {
            glare.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        } catch (const pv::NegotiationError&) {
            threw = true;
        }
        check(threw, "a remote offer while our offer is pending should be refused");
    }

    void test_late_closed_handler_errors_are_contained() {
        auto s = make_sender({pv::Codec::VP8});
        s.session->close("bye");

        bool escaped = false;
        int calls = 0;
        try {
            s.session->set_closed_handler([&](const std::string&) {
                ++calls;
                throw std::runtime_error("handler failed");
            });
        } catch (const std::exception&) {
            escaped = true;
        }
        check(calls == 1, "handler installed after Closed still runs");
        check(!escaped, "handler errors are contained like during teardown");
    }

    void test_destructor_closes() {
        std::atomic<int> closed_calls{0};
        {
            auto s = make_sender({pv::Codec::VP8});
            s.session->set_closed_handler([&](const std::string& reason) {
                ++closed_calls;
                check(reason == "destroyed", "destructor close reason");
            });
            s.session->begin_negotiation({pv::SdpType::Offer, "offer VP8"});
        }
        check(closed_calls == 1, "destroying a live session should close it once");
    }
}

int main() {
    test_transition_table();
    test_vp8_end_to_end_single_start();
    test_disjoint_codecs_fail_negotiation();
    test_malformed_offer();
    test_answer_failure_tears_down();
    test_negotiation_outside_negotiating();
    test_audio_is_negotiated_when_offered();
    test_concurrent_close_is_idempotent();
    test_transport_failure();
    test_media_events_drive_teardown();
    test_media_start_failure();
    test_stop_exception_is_swallowed();
    test_post_teardown_injection();
    test_receiver_flow();
    test_receiver_format_mismatch();
    test_connected_while_answer_is_applied();
    test_connected_then_negotiation_fails();
    test_receiver_answers_remote_offer();
    test_late_closed_handler_errors_are_contained();
    test_destructor_closes();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all session controller tests passed\n";
    return 0;
}
