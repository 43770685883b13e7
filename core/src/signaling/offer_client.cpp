#include <signaling/offer_client.hpp>

#include <common/errors.hpp>

#include <httplib.h>

#include <chrono>
#include <iostream>

namespace pv {
    std::pair<std::string, std::string> split_offer_url(const std::string& url) {
        const std::string scheme = "http://";
        if (url.rfind("https://", 0) == 0) {
            throw NegotiationError("https offer URLs are not supported: " + url);
        }
        if (url.rfind(scheme, 0) != 0) {
            throw NegotiationError("offer URL must start with http://: " + url);
        }

        const size_t path_pos = url.find('/', scheme.size());
        std::string base = path_pos == std::string::npos ? url : url.substr(0, path_pos);
        std::string path = path_pos == std::string::npos ? "/" : url.substr(path_pos);
        if (base.size() == scheme.size()) {
            throw NegotiationError("offer URL has no host: " + url);
        }
        return {std::move(base), std::move(path)};
    }

    std::string post_offer(const std::string& url, const std::string& sdp, int timeout_ms) {
        const auto [base, path] = split_offer_url(url);

        httplib::Client cli(base);
        cli.set_connection_timeout(std::chrono::milliseconds(timeout_ms));
        cli.set_read_timeout(std::chrono::milliseconds(timeout_ms));
        cli.set_write_timeout(std::chrono::milliseconds(timeout_ms));

        std::cout << "[Signaling] POST " << url << " (" << sdp.size() << " bytes)\n";
        auto res = cli.Post(path, sdp, "application/sdp");
        if (!res) {
            throw NegotiationError("offer POST to " + url + " failed: " + httplib::to_string(res.error()));
        }
        if (res->status != 200) {
            throw NegotiationError("signaling server answered " + std::to_string(res->status) + ": " + res->body);
        }
        if (res->body.empty()) {
            throw NegotiationError("signaling server returned an empty answer");
        }
        return res->body;
    }
}
