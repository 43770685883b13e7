#pragma once

#include <string>
#include <utility>

namespace pv {
    // "http://host:port/path" -> {"http://host:port", "/path"}. Throws
    // NegotiationError for anything that is not a plain http URL.
    std::pair<std::string, std::string> split_offer_url(const std::string& url);

    // POSTs the SDP offer and returns the answer body. Throws NegotiationError on
    // connection failure or a non-200 reply.
    std::string post_offer(const std::string& url, const std::string& sdp, int timeout_ms);
}
