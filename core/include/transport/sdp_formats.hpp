#pragma once

#include <string>
#include <vector>

#include <media/media_format.hpp>

namespace pv {
    // Formats advertised by every media section of `sdp`, in document order.
    // Throws NegotiationError when the text is not a usable SDP.
    std::vector<MediaFormat> parse_sdp_formats(const std::string& sdp);
}
