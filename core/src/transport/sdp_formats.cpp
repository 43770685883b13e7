#include <transport/sdp_formats.hpp>

#include <common/errors.hpp>

#include <gst/sdp/sdp.h>

#include <cstdlib>
#include <string>

namespace pv {
    std::vector<MediaFormat> parse_sdp_formats(const std::string& sdp) {
        GstSDPMessage* msg = nullptr;
        if (gst_sdp_message_new(&msg) != GST_SDP_OK) {
            throw NegotiationError("failed to allocate SDP message");
        }

        if (gst_sdp_message_parse_buffer(
                reinterpret_cast<const guint8*>(sdp.data()),
                sdp.size(), msg) != GST_SDP_OK) {
            gst_sdp_message_free(msg);
            throw NegotiationError("malformed SDP");
        }

        if (gst_sdp_message_medias_len(msg) == 0) {
            gst_sdp_message_free(msg);
            throw NegotiationError("SDP carries no media sections");
        }

        std::vector<MediaFormat> out;
        for (guint i = 0; i < gst_sdp_message_medias_len(msg); ++i) {
            const GstSDPMedia* media = gst_sdp_message_get_media(msg, i);
            const gchar* type = gst_sdp_media_get_media(media);
            if (!type) continue;

            const std::string kind_str = type;
            if (kind_str != "video" && kind_str != "audio") continue;
            const MediaKind kind = kind_str == "audio" ? MediaKind::Audio : MediaKind::Video;

            for (guint j = 0; j < gst_sdp_media_formats_len(media); ++j) {
                const gchar* fmt = gst_sdp_media_get_format(media, j);
                if (!fmt) continue;
                const int pt = std::atoi(fmt);

                GstCaps* caps = gst_sdp_media_get_caps_from_media(media, pt);
                if (!caps) continue;

                const GstStructure* st = gst_caps_get_structure(caps, 0);
                const gchar* enc = gst_structure_get_string(st, "encoding-name");
                const Codec codec = codec_from_str(enc ? enc : "");
                if (codec != Codec::Unknown && kind_of(codec) == kind) {
                    MediaFormat f = default_format(codec);
                    f.payload_type = pt;
                    int clock = 0;
                    if (gst_structure_get_int(st, "clock-rate", &clock) && clock > 0) {
                        f.clock_rate = clock;
                    }
                    if (const gchar* params = gst_structure_get_string(st, "encoding-params")) {
                        f.channels = std::atoi(params);
                    }
                    out.push_back(f);
                }
                gst_caps_unref(caps);
            }
        }

        gst_sdp_message_free(msg);
        return out;
    }
}
